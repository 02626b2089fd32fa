#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

#include <archive.h>
#include <archive_entry.h>

#include "core/archive_input.h"
#include "test_images.h"

using namespace tessera::core;
using tessera::test::TempDir;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Writes `files` (archive name -> contents) as a tar, gzip compressed when asked.
void write_tar(const fs::path& tar_path,
               const std::vector<std::pair<std::string, std::string>>& files,
               bool gzip) {
    struct archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    if (gzip) {
        archive_write_add_filter_gzip(a);
    }
    archive_write_set_format_pax_restricted(a);
    ASSERT_EQ(archive_write_open_filename(a, tar_path.string().c_str()), ARCHIVE_OK);
    for (const auto& [name, data] : files) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        ASSERT_EQ(archive_write_header(a, entry), ARCHIVE_OK);
        ASSERT_EQ(archive_write_data(a, data.data(), data.size()), static_cast<la_ssize_t>(data.size()));
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

} // namespace

TEST(ArchiveInput, DetectsContentType) {
    TempDir dir("detect");
    std::ofstream(dir.path() / "a.tar") << "x";
    std::ofstream(dir.path() / "b.TGZ") << "x";
    std::ofstream(dir.path() / "c.zip") << "x";
    EXPECT_EQ(detect_content_type_from_path(dir.path()), ContentType::Directory);
    EXPECT_EQ(detect_content_type_from_path(dir.path() / "a.tar"), ContentType::TarFile);
    EXPECT_EQ(detect_content_type_from_path(dir.path() / "b.TGZ"), ContentType::CompressedTarFile);
    EXPECT_EQ(detect_content_type_from_path(dir.path() / "c.zip"), ContentType::Unknown);
    EXPECT_EQ(detect_content_type_from_path(dir.path() / "missing"), ContentType::Unknown);
}

TEST(ArchiveInput, DirectoryIsUsedInPlace) {
    TempDir dir("dir_input");
    InputContext ctx;
    std::string error;
    ASSERT_TRUE(open_input(dir.path().string(), ctx, error)) << error;
    EXPECT_EQ(ctx.type, InputType::Directory);
    EXPECT_EQ(ctx.working_folder.string(), dir.path().string());
}

TEST(ArchiveInput, ExtractsCompressedTarAndCleansUp) {
    TempDir dir("tar_input");
    tessera::test::write_solid_png(dir.path() / "src.png", 4, 4, {1, 2, 3, 255});
    const std::string png = read_file(dir.path() / "src.png");
    const fs::path tar_path = dir.path() / "photos.tar.gz";
    write_tar(tar_path, {{"photos/one.png", png}, {"photos/sub/two.png", png}, {"../escape.png", png}}, true);

    fs::path extracted;
    {
        InputContext ctx;
        std::string error;
        ASSERT_TRUE(open_input(tar_path.string(), ctx, error)) << error;
        EXPECT_EQ(ctx.type, InputType::TarFile);
        extracted = ctx.working_folder;
        EXPECT_TRUE(fs::exists(extracted / "photos" / "one.png"));
        EXPECT_TRUE(fs::exists(extracted / "photos" / "sub" / "two.png"));
        EXPECT_FALSE(fs::exists(extracted.parent_path() / "escape.png"));
        EXPECT_EQ(read_file(extracted / "photos" / "one.png"), png);
    }
    EXPECT_FALSE(fs::exists(extracted));
}

TEST(ArchiveInput, RejectsUnknownInput) {
    TempDir dir("bad_input");
    std::ofstream(dir.path() / "list.txt") << "x";
    InputContext ctx;
    std::string error;
    EXPECT_FALSE(open_input((dir.path() / "list.txt").string(), ctx, error));
    EXPECT_FALSE(error.empty());
}
