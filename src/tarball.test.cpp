#include "tarball.hpp"
#include "errors.hpp"
#include "testing/support.hpp"

#include <catch2/catch.hpp>

#include <filesystem>

namespace fs = std::filesystem;
using namespace Depfetch;
using Depfetch::testing::TarEntry;
using Depfetch::testing::TempDir;
using Depfetch::testing::makeTarball;
using Depfetch::testing::makeTarballEntries;
using Depfetch::testing::readFile;

TEST_CASE("Remap the wrapper segment of entry paths") {
    CHECK(remapWrapperSegment("package/index.js", "lodash") == "lodash/index.js");
    CHECK(remapWrapperSegment("package/lib/a/b.js", "%40scope%2Fname")
          == "%40scope%2Fname/lib/a/b.js");
    CHECK(remapWrapperSegment("package", "lodash") == "lodash");
    CHECK(remapWrapperSegment("package/", "lodash") == "lodash/");
    CHECK(remapWrapperSegment("./package/index.js", "lodash") == "lodash/index.js");
    // Only a whole first segment counts
    CHECK(remapWrapperSegment("packages/index.js", "lodash") == "packages/index.js");
    CHECK(remapWrapperSegment("node-uuid/index.js", "uuid") == "node-uuid/index.js");
    CHECK(remapWrapperSegment("lib/package/x.js", "lodash") == "lib/package/x.js");
}

TEST_CASE("Extract a tarball into the encoded package folder") {
    TempDir tdir;
    const auto root = tdir.path() / "packages";

    const std::string tgz = makeTarball({
        {"package/package.json", R"({"name": "@scope/name"})"},
        {"package/lib/index.js", "module.exports = 42;\n"},
    });

    size_t written = extractTarball(tgz, root.string(), "%40scope%2Fname");
    CHECK(written == 2);

    const auto folder = root / "%40scope%2Fname";
    CHECK(readFile(folder / "lib" / "index.js") == "module.exports = 42;\n");
    CHECK(readFile(folder / "package.json") == R"({"name": "@scope/name"})");
    CHECK_FALSE(fs::exists(root / "package"));
}

TEST_CASE("Entries outside the wrapper are extracted where they say") {
    TempDir tdir;
    const std::string tgz = makeTarball({{"other/readme.md", "hi"}});

    extractTarball(tgz, tdir.path().string(), "pkg");
    CHECK(readFile(tdir.path() / "other" / "readme.md") == "hi");
}

TEST_CASE("Extracting twice overwrites the same folder") {
    TempDir tdir;
    extractTarball(makeTarball({{"package/v.txt", "one"}}), tdir.path().string(), "dup");
    extractTarball(makeTarball({{"package/v.txt", "two"}}), tdir.path().string(), "dup");
    CHECK(readFile(tdir.path() / "dup" / "v.txt") == "two");
}

TEST_CASE("Refuse entries that climb out of the root") {
    TempDir tdir;
    const auto root = tdir.path() / "packages";
    const std::string tgz = makeTarball({{"package/../../evil.txt", "gotcha"}});

    CHECK_THROWS_AS(extractTarball(tgz, root.string(), "pkg"), ExtractionError);
    CHECK_FALSE(fs::exists(tdir.path() / "evil.txt"));
}

TEST_CASE("Hardlinks are remapped into the package folder") {
    TempDir tdir;
    const auto root = tdir.path() / "packages";
    const std::string tgz = makeTarballEntries({
        {"package/a.txt", TarEntry::File, "shared"},
        {"package/b.txt", TarEntry::Hardlink, "package/a.txt"},
    });

    CHECK(extractTarball(tgz, root.string(), "pkg") == 2);
    CHECK(readFile(root / "pkg" / "b.txt") == "shared");
    CHECK(fs::equivalent(root / "pkg" / "a.txt", root / "pkg" / "b.txt"));
    CHECK_FALSE(fs::exists(root / "package"));
}

TEST_CASE("Symlinks pointing inside the package are kept") {
    TempDir tdir;
    const auto root = tdir.path() / "packages";
    const std::string tgz = makeTarballEntries({
        {"package/lib/index.js", TarEntry::File, "x"},
        {"package/main.js", TarEntry::Symlink, "lib/index.js"},
    });

    extractTarball(tgz, root.string(), "pkg");
    CHECK(fs::is_symlink(root / "pkg" / "main.js"));
    CHECK(readFile(root / "pkg" / "main.js") == "x");
}

TEST_CASE("Refuse symlinks that lead out of the root") {
    TempDir tdir;
    const auto root = tdir.path() / "packages";
    const auto outside = tdir.path() / "outside";
    fs::create_directories(outside);

    SECTION("absolute target") {
        const std::string tgz = makeTarballEntries({
            {"package/link", TarEntry::Symlink, outside.string()},
            {"package/link/evil.txt", TarEntry::File, "gotcha"},
        });
        CHECK_THROWS_AS(extractTarball(tgz, root.string(), "pkg"), ExtractionError);
    }

    SECTION("climbing target") {
        const std::string tgz = makeTarballEntries({
            {"package/link", TarEntry::Symlink, "../../outside"},
            {"package/link/evil.txt", TarEntry::File, "gotcha"},
        });
        CHECK_THROWS_AS(extractTarball(tgz, root.string(), "pkg"), ExtractionError);
    }

    SECTION("entry written through an earlier symlink") {
        const std::string tgz = makeTarballEntries({
            {"package/lib/keep.txt", TarEntry::File, "ok"},
            {"package/link", TarEntry::Symlink, "lib"},
            {"package/link/evil.txt", TarEntry::File, "gotcha"},
        });
        CHECK_THROWS_AS(extractTarball(tgz, root.string(), "pkg"), ExtractionError);
        CHECK_FALSE(fs::exists(root / "pkg" / "lib" / "evil.txt"));
    }

    CHECK_FALSE(fs::exists(outside / "evil.txt"));
}

TEST_CASE("A body that is not gzip is a decompression error") {
    TempDir tdir;
    CHECK_THROWS_AS(extractTarball("definitely not a tarball", tdir.path().string(), "pkg"),
                    DecompressionError);
}

TEST_CASE("A damaged archive is an extraction error") {
    TempDir tdir;
    std::string big;
    for (int i = 0; i < 4000; ++i) {
        big += std::to_string(i * 7919) + "\n";
    }
    std::string tgz = makeTarball({{"package/a.txt", big}, {"package/b.txt", big}});
    tgz.resize(tgz.size() / 2);

    CHECK_THROWS_AS(extractTarball(tgz, tdir.path().string(), "pkg"), ExtractionError);
}
