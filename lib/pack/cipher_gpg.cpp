#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include "pack/cipher.hpp"
#include "enc/params.hpp"
#include "log.hpp"
#include "util.hpp"

namespace pack {

// Data pipe on 0, passphrase on 3. Either may already sit on 0..3 when the
// standard fds were closed, so both are lifted above 3 first.
static int place_child_fds(int data, int pass){
  int d = fcntl(data, F_DUPFD_CLOEXEC, 4);
  if (d == -1) return -1;
  int pw = fcntl(pass, F_DUPFD_CLOEXEC, 4);
  if (pw == -1) return -1;
  if (dup2(d, 0) == -1 || dup2(pw, 3) == -1) return -1;
  return 0;
}

GpgCipher::GpgCipher(std::string program) : program_(std::move(program)) {}

std::vector<std::string> GpgCipher::argv(const std::string& dest) const {
  return { program_, "--batch", "--no-tty", "--symmetric",
           "--passphrase-fd", "3",
           "--output", dest,
           "-z", "0" };
}

int GpgCipher::encrypt(const std::string& source, const std::string& dest,
                       uint64_t offset, uint64_t length,
                       const std::string& pass_file){
  struct stat dst{};
  if (lstat(dest.c_str(), &dst) == 0) return -EEXIST;

  int pw = open(pass_file.c_str(), O_RDONLY | O_CLOEXEC);
  if (pw == -1) return -errno;

  int in = open(source.c_str(), O_RDONLY | O_CLOEXEC);
  if (in == -1) { int se = errno; close(pw); return -se; }

  struct stat st{};
  if (fstat(in, &st) == -1) { int se = errno; close(in); close(pw); return -se; }

  uint64_t size = static_cast<uint64_t>(st.st_size);
  if (offset > size || (length > 0 && length > size - offset)) {
    close(in); close(pw);
    return -ENODATA;
  }
  uint64_t plain_len = (length == 0) ? size - offset : length;

  int p[2];
  if (pipe2(p, O_CLOEXEC) == -1) { int se = errno; close(in); close(pw); return -se; }

  std::vector<std::string> args = argv(dest);
  std::vector<char*> cargs;
  cargs.reserve(args.size() + 1);
  std::string cmdline;
  for (auto& a : args) {
    cargs.push_back(const_cast<char*>(a.c_str()));
    if (!cmdline.empty()) cmdline += ' ';
    cmdline += a;
  }
  cargs.push_back(nullptr);
  util::log_msg(LOG_DEBUG, "running: %s < %s[%llu+%llu] 3<%s", cmdline.c_str(), source.c_str(),
                (unsigned long long)offset, (unsigned long long)plain_len, pass_file.c_str());

  pid_t pid = fork();
  if (pid == -1) {
    int se = errno;
    close(p[0]); close(p[1]); close(in); close(pw);
    return -se;
  }
  if (pid == 0) {
    if (place_child_fds(p[0], pw) == -1) _exit(127);
    execvp(cargs[0], cargs.data());
    _exit(127);
  }

  close(p[0]);
  close(pw);

  // Feed the byte range to gpg's stdin
  int rc = 0;
  std::vector<uint8_t> buf(enc::CHUNK_SIZE);
  uint64_t done = 0;
  while (done < plain_len) {
    size_t n = buf.size();
    if (plain_len - done < n) n = static_cast<size_t>(plain_len - done);
    ssize_t rn = util::fs::full_pread(in, buf.data(), n, static_cast<off_t>(offset + done));
    if (rn != static_cast<ssize_t>(n)) { rc = (rn < 0) ? -errno : -ENODATA; break; }
    rc = util::fs::full_write(p[1], buf.data(), n);
    if (rc != 0) break;
    done += n;
  }
  close(p[1]);
  close(in);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) { int se = errno; unlink(dest.c_str()); return -se; }
  }

  // A dead gpg also shows up as EPIPE above, report the exit instead
  if (!(WIFEXITED(status) && WEXITSTATUS(status) == 0)) {
    if (WIFEXITED(status))
      util::log_msg(LOG_ERR, "%s exited with status %d", program_.c_str(), WEXITSTATUS(status));
    else if (WIFSIGNALED(status))
      util::log_msg(LOG_ERR, "%s killed by signal %d", program_.c_str(), WTERMSIG(status));
    rc = -EIO;
  }

  if (rc != 0) unlink(dest.c_str());
  return rc;
}

}
