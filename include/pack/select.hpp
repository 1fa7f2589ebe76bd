#pragma once
#include <string>
#include <vector>

namespace pack {

// Archive named <fs>.<level>.<timestamp>.tar.bz2
struct Archive {
  std::string fs;
  std::string level;
};

// Splits a file name into filesystem id and level; false if it is not
// an archive name.
bool parse_archive_name(const std::string& name, Archive& out);

// For each filesystem (sorted by id) the latest level 0 archive, followed
// by the latest level 1 archive modified after it, if any. A filesystem
// without a level 0 archive is logged and left out. 0 or -errno when the
// directory cannot be read.
int select_backup_files(const std::string& backup_dir, std::vector<std::string>& out);

}
