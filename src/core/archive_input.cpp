#include "archive_input.h"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <system_error>

#include <archive.h>
#include <archive_entry.h>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace tessera::core {

namespace {

constexpr size_t k_archive_block_size = 10240;

bool make_temp_dir(const std::string& tag, fs::path& out, std::string& error) {
    static std::atomic<unsigned int> counter{0};
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        error = "failed to locate temporary directory: " + ec.message();
        return false;
    }
    fs::path dir = base / ("tessera_" + tag + "_" + std::to_string(::getpid()) + "_" +
                           std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    if (ec) {
        error = "failed to create temporary directory '" + dir.string() + "': " + ec.message();
        return false;
    }
    out = dir;
    return true;
}

// Copies every regular entry of an opened archive below output_dir.
bool extract_entries(struct archive* a, const fs::path& output_dir, std::string& error) {
    struct archive* ext = archive_write_disk_new();
    if (!ext) {
        error = "failed to create archive writer";
        return false;
    }
    archive_write_disk_set_options(ext, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                            ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_OK) {
            error = std::string("failed to read archive header: ") + archive_error_string(a);
            ok = false;
            break;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* filename = archive_entry_pathname(entry);
        if (!filename) {
            continue;
        }

        const fs::path relative = fs::path(filename).relative_path();
        if (relative.empty() ||
            std::any_of(relative.begin(), relative.end(), [](const fs::path& part) { return part == ".."; })) {
            continue;
        }
        const fs::path output_path = output_dir / relative;
        std::error_code ec;
        fs::create_directories(output_path.parent_path(), ec);
        if (ec) {
            error = "failed to create '" + output_path.parent_path().string() + "': " + ec.message();
            ok = false;
            break;
        }
        archive_entry_set_pathname(entry, output_path.string().c_str());

        r = archive_write_header(ext, entry);
        if (r < ARCHIVE_OK) {
            error = std::string("failed to write archive entry: ") + archive_error_string(ext);
            ok = false;
            break;
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while ((r = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext, buff, size, offset) < ARCHIVE_OK) {
                error = std::string("failed to write archive data: ") + archive_error_string(ext);
                ok = false;
                break;
            }
        }
        if (ok && r != ARCHIVE_EOF) {
            error = std::string("failed to read archive data: ") + archive_error_string(a);
            ok = false;
        }
        if (archive_write_finish_entry(ext) < ARCHIVE_OK && ok) {
            error = std::string("failed to finish archive entry: ") + archive_error_string(ext);
            ok = false;
        }
        if (!ok) {
            break;
        }
    }

    archive_write_close(ext);
    archive_write_free(ext);
    return ok;
}

} // namespace

InputContext::~InputContext() {
    cleanup();
}

void InputContext::track_temp_dir(fs::path dir) {
    temp_dirs_to_cleanup_.push_back(std::move(dir));
}

void InputContext::cleanup() {
    for (const auto& dir : temp_dirs_to_cleanup_) {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    temp_dirs_to_cleanup_.clear();
}

ContentType detect_content_type_from_path(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return ContentType::Directory;
    }
    if (!fs::is_regular_file(path, ec)) {
        return ContentType::Unknown;
    }

    const std::string filename = to_lower_copy(path.filename().string());
    auto ends_with = [&](const char* suffix) { return filename.ends_with(suffix); };
    if (ends_with(".tar")) {
        return ContentType::TarFile;
    }
    if (ends_with(".tar.gz") || ends_with(".tar.bz2") || ends_with(".tar.xz") ||
        ends_with(".tgz") || ends_with(".tbz2") || ends_with(".txz")) {
        return ContentType::CompressedTarFile;
    }
    return ContentType::Unknown;
}

bool extract_tar_file(const fs::path& tar_path, const fs::path& output_dir, std::string& error) {
    struct archive* a = archive_read_new();
    if (!a) {
        error = "failed to create archive reader";
        return false;
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, tar_path.string().c_str(), k_archive_block_size) != ARCHIVE_OK) {
        error = std::string("failed to open archive '") + tar_path.string() + "': " + archive_error_string(a);
        archive_read_free(a);
        return false;
    }

    const bool ok = extract_entries(a, output_dir, error);
    archive_read_close(a);
    archive_read_free(a);
    return ok;
}

bool extract_tar_from_fd(int fd, const fs::path& output_dir, std::string& error) {
    struct archive* a = archive_read_new();
    if (!a) {
        error = "failed to create archive reader";
        return false;
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_fd(a, fd, k_archive_block_size) != ARCHIVE_OK) {
        error = std::string("failed to open archive stream: ") + archive_error_string(a);
        archive_read_free(a);
        return false;
    }

    const bool ok = extract_entries(a, output_dir, error);
    archive_read_close(a);
    archive_read_free(a);
    return ok;
}

bool open_input(const std::string& input, InputContext& out, std::string& error) {
    if (input == "-") {
        fs::path temp_dir;
        if (!make_temp_dir("stdin", temp_dir, error)) {
            return false;
        }
        out.track_temp_dir(temp_dir);
        if (!extract_tar_from_fd(STDIN_FILENO, temp_dir, error)) {
            out.cleanup();
            return false;
        }
        out.type = InputType::StdinTar;
        out.working_folder = temp_dir;
        return true;
    }

    const fs::path input_path(input);
    switch (detect_content_type_from_path(input_path)) {
        case ContentType::Directory:
            out.type = InputType::Directory;
            out.working_folder = input_path;
            return true;
        case ContentType::TarFile:
        case ContentType::CompressedTarFile: {
            fs::path temp_dir;
            if (!make_temp_dir("extract", temp_dir, error)) {
                return false;
            }
            out.track_temp_dir(temp_dir);
            if (!extract_tar_file(input_path, temp_dir, error)) {
                out.cleanup();
                return false;
            }
            out.type = InputType::TarFile;
            out.working_folder = temp_dir;
            return true;
        }
        case ContentType::Unknown:
            break;
    }

    error = "input is neither a directory nor a tar archive: '" + input + "'";
    return false;
}

} // namespace tessera::core
