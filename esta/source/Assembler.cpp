#include <esta/Assembler.hpp>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <liberror/Try.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <ranges>
#include <sstream>
#include <string>

using namespace liberror;

namespace {

struct Line
{
    size_t number;
    std::string_view label;
    std::vector<std::string_view> tokens;
};

std::string_view trim(std::string_view text)
{
    auto const blank = " \t\r\v\f";

    auto begin = text.find_first_not_of(blank);
    if (begin == std::string_view::npos) return {};

    auto end = text.find_last_not_of(blank);
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string_view> tokenize(std::string_view text)
{
    std::vector<std::string_view> tokens;

    while (!(text = trim(text)).empty())
    {
        auto end = text.find_first_of(" \t\r\v\f");
        tokens.push_back(text.substr(0, end));
        text = end == std::string_view::npos ? std::string_view {} : text.substr(end);
    }

    return tokens;
}

bool is_identifier(std::string_view text)
{
    if (text.empty() || !(std::isalpha(static_cast<unsigned char>(text.front())) || text.front() == '_'))
    {
        return false;
    }

    return std::ranges::all_of(text, [] (char character) {
        return std::isalnum(static_cast<unsigned char>(character)) || character == '_';
    });
}

Result<Line> split(size_t number, std::string_view text)
{
    Line line { .number = number, .label = {}, .tokens = {} };

    text = trim(text.substr(0, text.find_first_of(";#")));

    if (auto colon = text.find(':'); colon != std::string_view::npos)
    {
        line.label = trim(text.substr(0, colon));

        if (!is_identifier(line.label))
        {
            return make_error("line {}: '{}' is not a valid label", number, line.label);
        }

        text = trim(text.substr(colon + 1));
    }

    line.tokens = tokenize(text);

    return line;
}

Result<Word> parse_word(size_t line, std::string_view text)
{
    if (text.starts_with('+'))
    {
        text.remove_prefix(1);
    }

    Word value {};
    auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (error != std::errc {} || end != text.data() + text.size())
    {
        return make_error("line {}: '{}' is not a valid integer", line, text);
    }

    return value;
}

Result<Opcode> parse_opcode(size_t line, std::string_view text)
{
    std::string mnemonic(text);
    std::ranges::transform(mnemonic, mnemonic.begin(), [] (char character) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
    });

    auto opcode = magic_enum::enum_cast<Opcode>(mnemonic);

    if (!opcode.has_value())
    {
        return make_error("line {}: unknown instruction '{}'", line, text);
    }

    return opcode.value();
}

}

Result<std::vector<Instruction>> assemble_source(std::string_view source)
{
    std::vector<Line> lines;
    std::map<std::string_view, Word> labels;

    size_t number = 0;
    Word instructions = 0;

    for (auto&& part : source | std::views::split('\n'))
    {
        auto line = TRY(split(++number, std::string_view(part.begin(), part.end())));

        if (!line.label.empty())
        {
            if (!labels.emplace(line.label, instructions).second)
            {
                return make_error("line {}: label '{}' was already defined", line.number, line.label);
            }
        }

        if (!line.tokens.empty())
        {
            instructions += 1;
        }

        lines.push_back(std::move(line));
    }

    std::vector<Instruction> program;

    for (auto const& line : lines)
    {
        if (line.tokens.empty()) continue;

        auto opcode = TRY(parse_opcode(line.number, line.tokens.front()));
        auto operands = line.tokens.size() - 1;

        if (!traits(opcode).immediate)
        {
            if (operands != 0)
            {
                return make_error("line {}: {} does not take an operand", line.number, magic_enum::enum_name(opcode));
            }

            program.push_back(make_instruction(opcode));
            continue;
        }

        if (operands != 1)
        {
            return make_error("line {}: {} takes exactly one operand", line.number, magic_enum::enum_name(opcode));
        }

        auto operand = line.tokens.back();

        if (opcode != Opcode::LOADC && is_identifier(operand))
        {
            auto label = labels.find(operand);

            if (label == labels.end())
            {
                return make_error("line {}: unknown label '{}'", line.number, operand);
            }

            program.push_back(make_instruction(opcode, label->second));
            continue;
        }

        program.push_back(make_instruction(opcode, TRY(parse_word(line.number, operand))));
    }

    return program;
}

Result<std::vector<Instruction>> assemble(std::filesystem::path const& source)
{
    if (!std::filesystem::exists(source))
    {
        return make_error("source {} does not exist.", source.string());
    }

    std::ifstream stream(source);

    if (!stream)
    {
        return make_error("could not open {}", source.string());
    }

    std::stringstream buffer;
    buffer << stream.rdbuf();

    auto text = buffer.str();

    return assemble_source(text);
}
