#include <esta/Assembler.hpp>
#include <esta/Machine.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <liberror/Result.hpp>
#include <liberror/Try.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <span>

using namespace liberror;

Result<void> safe_main(std::span<char const*> arguments)
{
    argparse::ArgumentParser args("esta", "", argparse::default_arguments::help);
    args.add_description("esta virtual machine");

    args.add_argument("-f", "--file").help("assembly to be executed").required();
    args.add_argument("-t", "--trace").help("print every step to stderr").default_value(false).implicit_value(true);
    args.add_argument("-d", "--dump").help("print the final stack, memory and heap").default_value(false).implicit_value(true);

    try
    {
        args.parse_args(static_cast<int>(arguments.size()), arguments.data());
    }
    catch (std::exception const& exception)
    {
        return liberror::make_error(exception.what());
    }

    auto source = std::filesystem::path(args.get<std::string>("--file"));

    auto program = TRY(assemble(source));

    Machine machine(std::move(program));
    machine.trace(args.get<bool>("--trace"));

    auto result = machine.run();

    if (args.get<bool>("--dump"))
    {
        fmt::print("{}", format_state(machine));
    }

    return result;
}

int main(int argc, char const** argv)
{
    auto result = safe_main(std::span<char const*>(argv, size_t(argc)));

    if (!result.has_value())
    {
        std::cout << result.error().message() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
