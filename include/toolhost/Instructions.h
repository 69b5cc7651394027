//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Instructions.h
// Purpose: Loading of the instructions text reported to clients
//==========================================================================================================

#pragma once

#include <string>

namespace toolhost {

// Built-in instructions text.
const std::string& DefaultInstructions();

//==========================================================================================================
// LoadInstructions
// Purpose: Returns the first non-empty (trimmed) file among MCP_INSTRUCTIONS_PATH and ./instructions.md,
//          else DefaultInstructions(). Unreadable files are skipped with a warning.
//==========================================================================================================
std::string LoadInstructions();

} // namespace toolhost
