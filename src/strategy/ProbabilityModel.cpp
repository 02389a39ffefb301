#include "strategy/ProbabilityModel.h"

#include <fstream>
#include <stdexcept>

namespace kestrel {
namespace strategy {

std::shared_ptr<FairValueModel> FairValueModel::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("fair values must be a JSON object");
    }
    auto model = std::make_shared<FairValueModel>();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw std::invalid_argument("fair value for " + it.key() + " is not a number");
        }
        model->set(it.key(), it.value().get<double>());
    }
    return model;
}

std::shared_ptr<FairValueModel> FairValueModel::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open fair values file: " + path);
    }
    nlohmann::json j;
    in >> j;
    return fromJson(j);
}

void FairValueModel::set(const std::string& key, double probability) {
    if (probability < 0.0 || probability > 1.0) {
        throw std::invalid_argument("probability out of range for " + key);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = probability;
}

std::optional<double> FairValueModel::lookup(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> FairValueModel::yesProbability(const network::Market& market) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto p = lookup(market.ticker)) {
        return p;
    }
    if (auto p = lookup(market.event_ticker)) {
        return p;
    }
    const auto dash = market.ticker.find('-');
    if (dash != std::string::npos) {
        return lookup(market.ticker.substr(0, dash));
    }
    return std::nullopt;
}

size_t FairValueModel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

} // namespace strategy
} // namespace kestrel
