#pragma once

#include <filesystem>
#include <string>

#include "core/contracts/ILedgerStore.h"

namespace kestrel {
namespace core {

// Pretty-printed JSON object (ticker -> position) written via temp file +
// rename. An unreadable file is renamed <name>.corrupted.<YYYYmmddHHMMSS>.
class LedgerStoreJson : public ILedgerStore {
public:
    explicit LedgerStoreJson(std::filesystem::path file_path);

    LedgerLoadResult load() override;
    StoreStatus save(const PositionMap& positions) override;
    StoreStatus backup(const PositionMap& positions, const std::string& tag,
                       std::string* written_path) override;
    std::string location() const override { return file_path_.string(); }

    static nlohmann::json toJson(const Position& position);
    static nlohmann::json toJson(const PositionMap& positions);
    // Throws on missing or invalid fields
    static Position fromJson(const std::string& ticker, const nlohmann::json& raw);

private:
    static bool writeAtomically(const std::filesystem::path& target, const nlohmann::json& raw);

    std::filesystem::path file_path_;
};

} // namespace core
} // namespace kestrel
