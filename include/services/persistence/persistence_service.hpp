// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


/**
 * @file persistence_service.hpp
 * @brief Key/value persistence contract and its QSettings implementation
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <QString>

namespace viewport_coordinator::services {

/**
 * @brief Abstract key/value store for serialized state
 */
class IPersistenceService {
public:
    virtual ~IPersistenceService() = default;

    /**
     * @brief Store a value under a key
     * @param key Storage key
     * @param value Serialized value
     * @param purpose Free-form tag describing what the value is
     * @return true on success
     */
    virtual bool store(const std::string& key, const std::string& value,
                       const std::string& purpose) = 0;

    [[nodiscard]] virtual std::optional<std::string> retrieve(const std::string& key) const = 0;

    /**
     * @brief Remove a key
     * @return true if the key existed
     */
    virtual bool remove(const std::string& key) = 0;
};

/**
 * @brief Persistence backed by QSettings
 *
 * Values are kept under the "Persistence/<key>" group of the given
 * organization/application settings scope.
 */
class SettingsPersistenceService : public IPersistenceService {
public:
    explicit SettingsPersistenceService(const QString& organization = "ViewportCoordinator",
                                        const QString& application = "ViewportCoordinator");
    ~SettingsPersistenceService() override;

    SettingsPersistenceService(const SettingsPersistenceService&) = delete;
    SettingsPersistenceService& operator=(const SettingsPersistenceService&) = delete;

    bool store(const std::string& key, const std::string& value,
               const std::string& purpose) override;
    [[nodiscard]] std::optional<std::string> retrieve(const std::string& key) const override;
    bool remove(const std::string& key) override;

    /**
     * @brief Purpose tag recorded with a key
     */
    [[nodiscard]] std::optional<std::string> purposeOf(const std::string& key) const;

    /**
     * @brief Remove every key written by this service
     */
    void clear();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
