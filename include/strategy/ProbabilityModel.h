#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "network/IExchangeClient.h"

namespace kestrel {
namespace strategy {

// Pluggable edge computation: probability that a market resolves YES
class IProbabilityModel {
public:
    virtual ~IProbabilityModel() = default;
    virtual std::optional<double> yesProbability(const network::Market& market) = 0;
};

// Fair values maintained outside the process (forecast job, analyst sheet).
// Lookup order: exact ticker, event ticker, series prefix.
class FairValueModel : public IProbabilityModel {
public:
    FairValueModel() = default;

    // {"KXHIGHNY-25JAN01-B45": 0.62, "KXBTC": 0.5, ...}
    static std::shared_ptr<FairValueModel> fromJson(const nlohmann::json& j);
    static std::shared_ptr<FairValueModel> fromFile(const std::string& path);

    void set(const std::string& key, double probability);
    std::optional<double> yesProbability(const network::Market& market) override;

    size_t size() const;

private:
    std::optional<double> lookup(const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, double> values_;
};

} // namespace strategy
} // namespace kestrel
