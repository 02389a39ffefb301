#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "core/contracts/ILedgerStore.h"

namespace kestrel {
namespace testing {

// Fresh scratch directory under the system temp dir
inline std::filesystem::path makeTempDir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("kestrel_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// In-memory store; fail_saves makes every save report WRITE_FAILED
class MemoryLedgerStore : public core::ILedgerStore {
public:
    core::LedgerLoadResult load() override {
        core::LedgerLoadResult result;
        result.status = has_data ? core::StoreStatus::OK : core::StoreStatus::MISSING;
        result.positions = saved;
        return result;
    }

    core::StoreStatus save(const core::PositionMap& positions) override {
        save_calls++;
        if (fail_saves) {
            return core::StoreStatus::WRITE_FAILED;
        }
        saved = positions;
        has_data = true;
        return core::StoreStatus::OK;
    }

    core::StoreStatus backup(const core::PositionMap& positions, const std::string& tag,
                             std::string* written_path) override {
        if (fail_saves) {
            return core::StoreStatus::WRITE_FAILED;
        }
        backups[tag] = positions;
        if (written_path) {
            *written_path = "memory://backup/" + tag;
        }
        return core::StoreStatus::OK;
    }

    std::string location() const override { return "memory://ledger"; }

    core::PositionMap saved;
    std::map<std::string, core::PositionMap> backups;
    bool has_data = false;
    bool fail_saves = false;
    int save_calls = 0;
};

} // namespace testing
} // namespace kestrel
