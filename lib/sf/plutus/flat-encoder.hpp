/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_PLUTUS_FLAT_ENCODER_HPP
#define SCRIPT_FORGE_PLUTUS_FLAT_ENCODER_HPP

#include <sf/plutus/types.hpp>

namespace script_forge::plutus::flat {
    // the output always ends with the padding and variable-length integers use the fewest groups
    extern uint8_vector encode(const program &prog);
}

#endif // !SCRIPT_FORGE_PLUTUS_FLAT_ENCODER_HPP
