#include "ward/entitlements.hpp"
#include <algorithm>

namespace ward
{
    namespace
    {
        const std::vector<std::string> kBasic = {
            "encrypted_storage", "secure_dns", "vpn_client", "password_manager", "anti_ransomware"};

        const std::vector<std::string> kGamer = {
            "gaming_mode", "ray_tracing", "dlss3", "fsr3",
            "8k_upscaling", "rgb_ecosystem", "3ms_latency", "game_optimizer"};

        const std::vector<std::string> kWorkplace = {
            "active_directory", "sso_support", "remote_desktop", "team_collaboration",
            "office_365_compatibility", "meeting_scheduler", "expense_tracker", "business_vpn"};

        const std::vector<std::string> kAiDev = {
            "cuda_12_3", "rocm", "intel_oneapi", "pytorch", "tensorflow",
            "jupyter_lab", "ml_libraries", "triton_server", "langchain", "vector_dbs"};

        const std::vector<std::string> kGamerAi = {
            "gaming_mode", "ray_tracing", "dlss3", "fsr3", "8k_upscaling",
            "rgb_ecosystem", "1ms_latency", "game_optimizer", "cuda_12_3", "pytorch",
            "tensorflow", "ml_gaming_optimization", "ai_upscaling"};

        const std::vector<std::string> kServer = {
            "kubernetes", "docker_swarm", "high_availability", "auto_scaling",
            "disaster_recovery", "zero_trust", "multi_region", "100k_rps"};
    } // namespace

    const std::vector<std::string> &tier_entitlements(Tier tier)
    {
        switch (tier)
        {
        case Tier::Basic:
            return kBasic;
        case Tier::Workplace:
            return kWorkplace;
        case Tier::Gamer:
            return kGamer;
        case Tier::AiDev:
            return kAiDev;
        case Tier::GamerAi:
            return kGamerAi;
        case Tier::Server:
            return kServer;
        }
        return kBasic;
    }

    bool tier_has_feature(Tier tier, const std::string &feature)
    {
        const auto &features = tier_entitlements(tier);
        return std::find(features.begin(), features.end(), feature) != features.end();
    }

} // namespace ward
