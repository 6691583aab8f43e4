#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fixpoint {

struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;
    std::string fixMode;
    uint64_t timestampEpochSec = 0;
    std::vector<std::string> sourceFiles;

    // Run totals
    std::map<std::string, unsigned> fixed;  // per rule code
    unsigned suppressed = 0;
    unsigned filesFailed = 0;
    std::vector<std::string> unconvergedFiles;
};

} // namespace fixpoint
