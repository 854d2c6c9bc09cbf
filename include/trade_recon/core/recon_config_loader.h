#pragma once

#include <string>

#include "trade_recon/core/recon_config.h"

namespace trade_recon {

class ReconConfigLoader {
   public:
    static bool LoadFromYaml(const std::string& path, ReconConfig* config, std::string* error);
};

}  // namespace trade_recon
