#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tessera::core {

enum class ContentType {
    Directory,
    TarFile,
    CompressedTarFile,
    Unknown
};

enum class InputType {
    Directory,
    TarFile,
    StdinTar
};

// Where the corpus images live once the input argument is resolved. Archives
// are extracted into a private temporary directory that is removed when the
// context is destroyed.
class InputContext {
public:
    InputContext() = default;
    ~InputContext();

    InputContext(const InputContext&) = delete;
    InputContext& operator=(const InputContext&) = delete;

    InputType type = InputType::Directory;
    std::filesystem::path working_folder;

    void track_temp_dir(std::filesystem::path dir);
    void cleanup();

private:
    std::vector<std::filesystem::path> temp_dirs_to_cleanup_;
};

ContentType detect_content_type_from_path(const std::filesystem::path& path);

bool extract_tar_file(const std::filesystem::path& tar_path,
                      const std::filesystem::path& output_dir,
                      std::string& error);
bool extract_tar_from_fd(int fd, const std::filesystem::path& output_dir, std::string& error);

// Resolves `input` ("-" meaning a tar stream on stdin) into a folder of images.
bool open_input(const std::string& input, InputContext& out, std::string& error);

} // namespace tessera::core
