#pragma once

#include <dv_alm/core/process.hpp>
#include <dv_alm/core/result.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dv_alm {

enum class PackageType {
    Unmanaged,
    Managed,
    Both,
};

std::string PackageTypeName(PackageType type);

/// With PackageType::Both the packager works on a pair of zips: `X.zip`
/// (unmanaged) and `X_managed.zip` beside it.
std::filesystem::path ManagedZipPath(const std::filesystem::path& unmanaged_zip);

// ---------------------------------------------------------------------------
// ISolutionPackager — pack and unpack solution folders.
// ---------------------------------------------------------------------------
class ISolutionPackager {
public:
    virtual ~ISolutionPackager() = default;

    [[nodiscard]] virtual Result<void, Error> Pack(const std::filesystem::path& folder,
                                                   const std::filesystem::path& zip,
                                                   PackageType type) = 0;

    [[nodiscard]] virtual Result<void, Error> Unpack(const std::filesystem::path& zip,
                                                     const std::filesystem::path& folder,
                                                     PackageType type) = 0;
};

// ---------------------------------------------------------------------------
// PacPackager — runs `pac solution pack|unpack` through an IProcessRunner.
// ---------------------------------------------------------------------------
class PacPackager : public ISolutionPackager {
public:
    explicit PacPackager(IProcessRunner& runner, std::string program = "pac")
        : runner_(runner), program_(std::move(program)) {}

    [[nodiscard]] Result<void, Error> Pack(const std::filesystem::path& folder,
                                           const std::filesystem::path& zip,
                                           PackageType type) override;

    [[nodiscard]] Result<void, Error> Unpack(const std::filesystem::path& zip,
                                             const std::filesystem::path& folder,
                                             PackageType type) override;

private:
    Result<void, Error> RunPac(const char* operation, const std::string& target,
                               std::vector<std::string> args);

    IProcessRunner& runner_;
    std::string program_;
};

} // namespace dv_alm
