#include "chachamir/utilities/file_store.hpp"
#include "chachamir/core/format.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace chachamir::utilities {
namespace fs = std::filesystem;

Result<std::vector<uint8_t>, ChachamirFailure> FileStore::Read(const fs::path& path) {
    using BytesResult = Result<std::vector<uint8_t>, ChachamirFailure>;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return BytesResult::Err(ChachamirFailure::Io(
            compat::format("Could not open file {}", path.string())));
    }
    std::vector<uint8_t> contents(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());
    if (in.bad()) {
        return BytesResult::Err(ChachamirFailure::Io(
            compat::format("Could not read file {}", path.string())));
    }
    return BytesResult::Ok(std::move(contents));
}

Result<Unit, ChachamirFailure> FileStore::Write(const fs::path& path, std::span<const uint8_t> contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<Unit, ChachamirFailure>::Err(ChachamirFailure::Io(
            compat::format("Could not create file {}", path.string())));
    }
    out.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
        return Result<Unit, ChachamirFailure>::Err(ChachamirFailure::Io(
            compat::format("Could not write file {}", path.string())));
    }
    return Result<Unit, ChachamirFailure>::Ok(unit);
}

Result<std::vector<std::string>, ChachamirFailure> FileStore::ListRegularFiles(const fs::path& directory) {
    using NamesResult = Result<std::vector<std::string>, ChachamirFailure>;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return NamesResult::Err(ChachamirFailure::Io(
            compat::format("Failed to read share directory {}: {}", directory.string(), ec.message())));
    }

    std::vector<std::string> names;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return NamesResult::Err(ChachamirFailure::Io(
                compat::format("Failed to read share directory {}: {}", directory.string(), ec.message())));
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && !type_ec) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return NamesResult::Err(ChachamirFailure::Io(
            compat::format("Failed to read share directory {}: {}", directory.string(), ec.message())));
    }
    std::sort(names.begin(), names.end());
    return NamesResult::Ok(std::move(names));
}

DirectoryShareSource::DirectoryShareSource(fs::path directory)
    : directory_(std::move(directory)) {
}

Result<std::vector<std::string>, ChachamirFailure> DirectoryShareSource::ListCandidates() {
    return FileStore::ListRegularFiles(directory_);
}

Result<std::vector<uint8_t>, ChachamirFailure> DirectoryShareSource::Load(const std::string& name) {
    return FileStore::Read(directory_ / name);
}
}
