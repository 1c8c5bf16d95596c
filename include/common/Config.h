#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace triplersi {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 경고 후 기본값 유지
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // 검증 오류 목록 (비어 있으면 통과)
    std::vector<std::string> validate() const;

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    const engine::EngineConfig& getEngineConfig() const { return engine_config_; }

    static std::vector<std::string> validate(const engine::EngineConfig& config);

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;
    engine::EngineConfig engine_config_;
};

} // namespace triplersi
