#pragma once

#include <esta/Instruction.hpp>

#include <liberror/Result.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

/*
 * One instruction per line, `;` or `#` start a comment.
 *
 *     loop:
 *         LOADC 0
 *         LOAD
 *         JUMPZ done
 *         JUMP loop
 *     done: HALT
 *
 * Mnemonics are case insensitive. JUMP and JUMPZ take either an instruction
 * index or a label.
 */
liberror::Result<std::vector<Instruction>> assemble_source(std::string_view source);
liberror::Result<std::vector<Instruction>> assemble(std::filesystem::path const& source);
