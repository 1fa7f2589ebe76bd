#include <catch2/catch.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "pack/driver.hpp"
#include "pack/predict.hpp"
#include "helpers.hpp"

using namespace pack;
using testutil::Call;
using testutil::RecordingCipher;
using testutil::TempDir;

namespace {

struct Fixture {
    TempDir tmp;
    std::string src;
    std::string work;

    Fixture()
    {
        src = tmp / "src";
        work = tmp / "work";
        mkdir(src.c_str(), 0755);
        mkdir(work.c_str(), 0755);
    }

    std::string file(const std::string& name, off_t size)
    {
        std::string p = src + "/" + name;
        REQUIRE(testutil::make_sized_file(p, size));
        return p;
    }

    PackOptions options(const Limits& lim, bool dry_run = false) const
    {
        PackOptions opt;
        opt.work_dir = work;
        opt.limits = lim;
        opt.pass_file = "/etc/backup/pw";
        opt.dry_run = dry_run;
        return opt;
    }
};

}

TEST_CASE("Destination names", "[pack::driver]")
{
    CHECK(dest_name("/w", 1, "/b/home.0.1.tar.bz2", 1, 1, ".gpg") == "/w/1/home.0.1.tar.bz2.gpg");
    CHECK(dest_name("/w/", 3, "/b/home.0.1.tar.bz2", 3, 7, ".gpg") == "/w/3/home.0.1.tar.bz2.03of07.gpg");
    CHECK(dest_name("/w", 12, "x", 100, 120, ".aes") == "/w/12/x.100of120.aes");
}

TEST_CASE("One file split over three volumes", "[pack::driver]")
{
    Fixture fx;
    std::string f = fx.file("big.0.1.tar.bz2", 25000);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({f}, fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.volumes == 3);
    CHECK(res.parts == 3);
    CHECK(res.ok());
    REQUIRE(cipher.calls.size() == 3);

    CHECK(cipher.calls[0].dest == fx.work + "/1/big.0.1.tar.bz2.01of03.gpg");
    CHECK(cipher.calls[1].dest == fx.work + "/2/big.0.1.tar.bz2.02of03.gpg");
    CHECK(cipher.calls[2].dest == fx.work + "/3/big.0.1.tar.bz2.03of03.gpg");

    CHECK(cipher.calls[0].offset == 0);
    CHECK(cipher.calls[0].length == 10000);
    CHECK(cipher.calls[1].offset == 10000);
    CHECK(cipher.calls[1].length == 10000);
    CHECK(cipher.calls[2].offset == 20000);
    CHECK(cipher.calls[2].length == 0);   // to end of file

    CHECK(cipher.calls[0].pass_file == "/etc/backup/pw");
    CHECK(testutil::exists(fx.work + "/3"));
    CHECK_FALSE(testutil::exists(fx.work + "/4"));
}

TEST_CASE("Second file rolls into the next volume", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 6000);
    std::string b = fx.file("b.0.1.tar.bz2", 6000);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({a, b}, fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.volumes == 2);
    REQUIRE(cipher.calls.size() == 3);

    CHECK(cipher.calls[0].dest == fx.work + "/1/a.0.1.tar.bz2.gpg");
    CHECK(cipher.calls[0].length == 0);

    CHECK(cipher.calls[1].dest == fx.work + "/1/b.0.1.tar.bz2.01of02.gpg");
    CHECK(cipher.calls[1].offset == 0);
    CHECK(cipher.calls[1].length == 4000);

    CHECK(cipher.calls[2].dest == fx.work + "/2/b.0.1.tar.bz2.02of02.gpg");
    CHECK(cipher.calls[2].offset == 4000);
    CHECK(cipher.calls[2].length == 0);
}

TEST_CASE("Per-file ceiling splits inside one volume", "[pack::driver]")
{
    Fixture fx;
    std::string f = fx.file("c.0.1.tar.bz2", 7000);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({f}, fx.options(Limits{10000, 3000, 100}), cipher, res) == 0);

    CHECK(res.volumes == 1);
    REQUIRE(cipher.calls.size() == 3);
    CHECK(cipher.calls[0].length == 3000);
    CHECK(cipher.calls[1].offset == 3000);
    CHECK(cipher.calls[1].length == 3000);
    CHECK(cipher.calls[2].offset == 6000);
    CHECK(cipher.calls[2].length == 0);
    for (const auto& c : cipher.calls)
        CHECK(c.dest.find("/1/c.0.1.tar.bz2.0") != std::string::npos);
}

TEST_CASE("Dry run plans without writing", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 6000);
    std::string b = fx.file("b.0.1.tar.bz2", 16000);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({a, b}, fx.options(Limits{10000, 10000, 100}, true), cipher, res) == 0);

    // b: 4000 in volume 1, 10000 in volume 2, 2000 in volume 3
    CHECK(res.volumes == 3);
    CHECK(res.parts == 4);
    CHECK(res.ok());
    CHECK(cipher.calls.empty());
    CHECK(testutil::count_entries(fx.work) == 0);
}

TEST_CASE("Every byte lands in exactly one part", "[pack::driver]")
{
    struct Config { Limits lim; std::vector<off_t> sizes; };
    const std::vector<Config> configs = {
        {{10000, 10000, 100}, {25000, 6000, 6000, 1, 99, 100, 10000}},
        {{10050, 10050, 100}, {20100, 50, 10050, 333}},
        {{10000, 3000, 100}, {7000, 2999, 3000, 3001, 12345}},
        {{4096 * 10 + 17, 4096 * 3 + 5, 4096}, {200000, 4096, 4095, 65537}},
    };

    for (const auto& cfg : configs)
    {
        Fixture fx;
        std::vector<std::string> files;
        std::map<std::string, uint64_t> sizes;
        for (size_t i = 0; i < cfg.sizes.size(); i++)
        {
            std::string f = fx.file("f" + std::to_string(i) + ".0.1.tar.bz2", cfg.sizes[i]);
            files.push_back(f);
            sizes[f] = static_cast<uint64_t>(cfg.sizes[i]);
        }

        RecordingCipher cipher;
        PackResult res;
        REQUIRE(pack_files(files, fx.options(cfg.lim), cipher, res) == 0);
        CHECK(res.ok());

        const uint64_t cap = cfg.lim.max_file_size / cfg.lim.block_size * cfg.lim.block_size;
        std::map<std::string, std::vector<Call>> by_file;
        for (const auto& c : cipher.calls)
            by_file[c.source].push_back(c);

        // predictions made from a replay of the same placement
        uint64_t remaining = 0;
        for (const auto& f : files)
        {
            const auto& parts = by_file[f];
            INFO(f << " size " << sizes[f]);
            CHECK(static_cast<uint64_t>(parts.size()) == predict_parts(sizes[f], remaining, cfg.lim));

            uint64_t next = 0;
            for (size_t i = 0; i < parts.size(); i++)
            {
                CHECK(parts[i].offset == next);
                uint64_t len = parts[i].length ? parts[i].length : sizes[f] - parts[i].offset;
                if (parts[i].length)
                {
                    CHECK(parts[i].length <= cap);
                    CHECK(parts[i].length % cfg.lim.block_size == 0);
                }
                next += len;

                uint64_t left = sizes[f] - parts[i].offset;
                step_once(remaining, left, cfg.lim);

                if (parts.size() > 1)
                {
                    char tag[32];
                    std::snprintf(tag, sizeof(tag), ".%02dof%02d.gpg", static_cast<int>(i + 1),
                                  static_cast<int>(parts.size()));
                    CHECK(parts[i].dest.find(tag) != std::string::npos);
                }
            }
            CHECK(next == sizes[f]);
        }
    }
}

TEST_CASE("Same basename twice in one volume is rejected", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("home.0.1.tar.bz2", 1000);
    mkdir((fx.src + "/other").c_str(), 0755);
    std::string b = fx.src + "/other/home.0.1.tar.bz2";
    REQUIRE(testutil::make_sized_file(b, 1000));

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({a, b}, fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.parts == 2);
    CHECK(res.failed_parts == 1);
    CHECK_FALSE(res.ok());
    REQUIRE(cipher.calls.size() == 1);
    CHECK(cipher.calls[0].source == a);
}

TEST_CASE("Same basename in different volumes is fine", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("home.0.1.tar.bz2", 10000);
    mkdir((fx.src + "/other").c_str(), 0755);
    std::string b = fx.src + "/other/home.0.1.tar.bz2";
    REQUIRE(testutil::make_sized_file(b, 1000));

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({a, b}, fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.ok());
    REQUIRE(cipher.calls.size() == 2);
    CHECK(cipher.calls[1].dest == fx.work + "/2/home.0.1.tar.bz2.gpg");
}

TEST_CASE("Unreadable and empty inputs", "[pack::driver]")
{
    Fixture fx;
    std::string empty = fx.file("empty.0.1.tar.bz2", 0);
    std::string good = fx.file("good.0.1.tar.bz2", 500);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({fx.src + "/missing.0.1.tar.bz2", empty, good},
                       fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.skipped_files == 1);
    CHECK(res.failed_parts == 0);
    CHECK(res.volumes == 1);
    REQUIRE(cipher.calls.size() == 1);
    CHECK(cipher.calls[0].source == good);
}

TEST_CASE("File needing more parts than can be numbered is skipped", "[pack::driver]")
{
    Fixture fx;
    // sparse, 6 GiB cut into 1-byte parts
    std::string huge = fx.file("huge.0.1.tar.bz2", static_cast<off_t>(3ull << 31));
    std::string good = fx.file("good.0.1.tar.bz2", 3);

    RecordingCipher cipher;
    PackResult res;
    REQUIRE(pack_files({huge, good}, fx.options(Limits{10, 1, 1}, true), cipher, res) == 0);

    CHECK(res.skipped_files == 1);
    CHECK(res.parts == 3);
    CHECK(res.failed_parts == 0);
    CHECK_FALSE(res.ok());
}

TEST_CASE("Failed part does not stop the run", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 25000);
    std::string b = fx.file("b.0.1.tar.bz2", 100);

    RecordingCipher cipher;
    cipher.fail_on = {1};
    PackResult res;
    REQUIRE(pack_files({a, b}, fx.options(Limits{10000, 10000, 100}), cipher, res) == 0);

    CHECK(res.failed_parts == 1);
    CHECK(res.parts == 4);
    CHECK(res.volumes == 3);
    REQUIRE(cipher.calls.size() == 4);
    CHECK(cipher.calls[2].offset == 20000);
    CHECK(cipher.calls[3].source == b);
}

TEST_CASE("Volume directory failure is fatal", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 100);

    PackOptions opt = fx.options(Limits{10000, 10000, 100});
    opt.work_dir = fx.tmp / "nowhere";

    RecordingCipher cipher;
    PackResult res;
    CHECK(pack_files({a}, opt, cipher, res) == -ENOENT);
    CHECK(cipher.calls.empty());
    CHECK(res.volumes == 0);
}

TEST_CASE("Cancellation between parts", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 25000);

    std::atomic<bool> cancel{true};
    PackOptions opt = fx.options(Limits{10000, 10000, 100});
    opt.cancel = &cancel;

    RecordingCipher cipher;
    PackResult res;
    CHECK(pack_files({a}, opt, cipher, res) == -ECANCELED);
    CHECK(res.cancelled);
    CHECK_FALSE(res.ok());
    CHECK(cipher.calls.empty());
}

TEST_CASE("Invalid limits are refused", "[pack::driver]")
{
    Fixture fx;
    RecordingCipher cipher;
    PackResult res;
    CHECK(pack_files({}, fx.options(Limits{10000, 50, 100}), cipher, res) == -EINVAL);
}

TEST_CASE("Independent runs do not share state", "[pack::driver]")
{
    Fixture fx;
    std::string a = fx.file("a.0.1.tar.bz2", 6000);

    Fixture other;
    std::string b = other.file("b.0.1.tar.bz2", 6000);

    RecordingCipher c1, c2;
    PackResult r1, r2;
    REQUIRE(pack_files({a}, fx.options(Limits{10000, 10000, 100}, true), c1, r1) == 0);
    REQUIRE(pack_files({b}, other.options(Limits{10000, 10000, 100}, true), c2, r2) == 0);
    CHECK(r1.volumes == 1);
    CHECK(r2.volumes == 1);
    CHECK(r2.parts == 1);
}
