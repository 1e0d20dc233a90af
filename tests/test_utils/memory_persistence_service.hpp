#pragma once

#include "services/persistence/persistence_service.hpp"

#include <map>
#include <string>

namespace viewport_coordinator::test_utils {

/**
 * @brief Map-backed persistence with a switchable write failure
 */
class MemoryPersistenceService : public services::IPersistenceService {
public:
    bool failWrites = false;
    std::map<std::string, std::string> values;
    std::map<std::string, std::string> purposes;

    bool store(const std::string& key, const std::string& value,
               const std::string& purpose) override {
        if (failWrites) return false;
        values[key] = value;
        purposes[key] = purpose;
        return true;
    }

    std::optional<std::string> retrieve(const std::string& key) const override {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    bool remove(const std::string& key) override {
        purposes.erase(key);
        return values.erase(key) > 0;
    }
};

}  // namespace viewport_coordinator::test_utils
