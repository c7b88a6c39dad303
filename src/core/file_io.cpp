#include <dv_alm/core/file_io.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace dv_alm {

Result<std::string, Error> ReadBinaryFile(const std::filesystem::path& path,
                                          ErrorCategory category) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(Error{
            "ReadFile", path.string(), std::nullopt, "Cannot open file",
            std::nullopt, category});
    }
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    return Result<std::string, Error>::Ok(std::move(data));
}

Result<void, Error> WriteBinaryFile(const std::filesystem::path& path,
                                    const std::string& data,
                                    ErrorCategory category) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::Err(Error{
                "WriteFile", path.parent_path().string(), std::nullopt,
                "Cannot create directory: " + ec.message(), std::nullopt, category});
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(Error{
            "WriteFile", path.string(), std::nullopt, "Cannot open file for writing",
            std::nullopt, category});
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Result<void, Error>::Err(Error{
            "WriteFile", path.string(), std::nullopt, "Write failed",
            std::nullopt, category});
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ReplaceDirectory(const std::filesystem::path& source,
                                     const std::filesystem::path& target,
                                     ErrorCategory category) {
    namespace fs = std::filesystem;
    auto failure = [&](const std::string& message) {
        return Result<void, Error>::Err(Error{
            "ReplaceDirectory", target.string(), std::nullopt,
            message, std::nullopt, category});
    };

    // Copy next to the target first; the target is only touched once the
    // copy is complete.
    const fs::path incoming = target.string() + ".incoming";
    const fs::path outgoing = target.string() + ".outgoing";
    std::error_code ec;
    fs::remove_all(incoming, ec);
    fs::remove_all(outgoing, ec);
    ec.clear();
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    if (!ec) {
        fs::copy(source, incoming, fs::copy_options::recursive, ec);
    }
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(incoming, cleanup);
        return failure("Cannot copy from " + source.string() + ": " + ec.message());
    }

    const bool had_target = fs::exists(target, ec);
    if (had_target) {
        fs::rename(target, outgoing, ec);
        if (ec) {
            std::error_code cleanup;
            fs::remove_all(incoming, cleanup);
            return failure("Cannot move the old folder aside: " + ec.message());
        }
    }
    fs::rename(incoming, target, ec);
    if (ec) {
        std::error_code restore;
        if (had_target) fs::rename(outgoing, target, restore);
        fs::remove_all(incoming, restore);
        return failure("Cannot move the new folder into place: " + ec.message());
    }
    fs::remove_all(outgoing, ec);
    if (ec) {
        return failure("Cannot remove the old folder " + outgoing.string() + ": " +
                       ec.message());
    }
    return Result<void, Error>::Ok();
}

} // namespace dv_alm
