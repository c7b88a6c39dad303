#include <dv_alm/tools/solution_packager.hpp>

#include <dv_alm/core/log.hpp>

namespace dv_alm {

std::string PackageTypeName(PackageType type) {
    switch (type) {
        case PackageType::Unmanaged: return "Unmanaged";
        case PackageType::Managed:   return "Managed";
        case PackageType::Both:      return "Both";
    }
    return "Unmanaged";
}

std::filesystem::path ManagedZipPath(const std::filesystem::path& unmanaged_zip) {
    auto managed = unmanaged_zip;
    managed.replace_filename(unmanaged_zip.stem().string() + "_managed" +
                             unmanaged_zip.extension().string());
    return managed;
}

Result<void, Error> PacPackager::RunPac(const char* operation,
                                        const std::string& target,
                                        std::vector<std::string> args) {
    ProcessSpec spec;
    spec.program = program_;
    spec.args = std::move(args);

    LogInfo("packager", spec.CommandLine());
    auto result = runner_.Run(spec);
    if (result.IsErr()) {
        return Result<void, Error>::Err(
            std::move(result).Error().WithCategory(ErrorCategory::Packager));
    }
    const auto& process = result.Value();
    if (!process.Succeeded()) {
        auto detail = process.err.empty() ? process.out : process.err;
        return Result<void, Error>::Err(Error{
            operation, target, std::nullopt,
            program_ + " exited with code " + std::to_string(process.exit_code) +
                (detail.empty() ? "" : ": " + detail),
            std::nullopt, ErrorCategory::Packager});
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> PacPackager::Pack(const std::filesystem::path& folder,
                                      const std::filesystem::path& zip,
                                      PackageType type) {
    return RunPac("Pack", zip.string(), {
        "solution", "pack",
        "--zipfile", zip.string(),
        "--folder", folder.string(),
        "--packagetype", PackageTypeName(type),
    });
}

Result<void, Error> PacPackager::Unpack(const std::filesystem::path& zip,
                                        const std::filesystem::path& folder,
                                        PackageType type) {
    return RunPac("Unpack", zip.string(), {
        "solution", "unpack",
        "--zipfile", zip.string(),
        "--folder", folder.string(),
        "--packagetype", PackageTypeName(type),
        "--allowDelete", "true",
        "--allowWrite", "true",
    });
}

} // namespace dv_alm
