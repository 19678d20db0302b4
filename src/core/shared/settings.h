#pragma once

#include "core/shared/exploration_config.h"
#include "core/text/tokenizer.h"

namespace fr {

struct Settings {
    // Tokenization
    TokenizerConfig tokenizer;

    // Retrieval loop
    ExplorationConfig exploration;

    // Result cache (<= 0 disables it)
    int cacheCapacity = 10000;
};

} // namespace fr
