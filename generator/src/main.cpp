/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <args.hxx>

#include <peergen/internal/logger.h>

#include "code_generator.h"
#include "loader.h"

using namespace std;

// a file is only rewritten when its content changes, so dependent builds are not triggered needlessly
bool is_different(const std::filesystem::path& path, const std::string& data)
{
    if (!std::filesystem::exists(path))
        return true;
    string existing;
    ifstream file(path);
    std::getline(file, existing, '\0');
    return existing != data;
}

void write_if_different(const std::filesystem::path& path, const std::string& data)
{
    if (!is_different(path, data))
    {
        PEERGEN_DEBUG("{} unchanged", path.string());
        return;
    }
    ofstream file(path);
    if (!file)
        throw peergen::error("unable to write " + path.string());
    file << data;
    PEERGEN_INFO("wrote {}", path.string());
}

int main(const int argc, char* argv[])
{
    try
    {
        args::ArgumentParser args_parser("Generate initiator and responder C++ headers from a protocol metamodel");
        args::HelpFlag h(args_parser, "help", "help", {"help"});

        args::ValueFlag<std::string> input_arg(
            args_parser, "path", "the metaModel.json to be read", {'i', "input"}, args::Options::Required);
        args::ValueFlag<std::string> output_path_arg(
            args_parser, "path", "the output directory", {'p', "output_path"}, args::Options::Required);
        args::ValueFlag<std::string> namespace_arg(
            args_parser, "namespace", "namespace of the generated code", {'N', "namespace"});
        args::ValueFlagList<std::string> recursive_aliases_arg(
            args_parser, "alias", "type alias that takes part in recursion", {'R', "recursive_alias"});
        args::Flag no_proposed_arg(
            args_parser, "no_proposed", "leave out everything flagged as proposed", {"no_proposed"});
        args::Flag verbose_arg(args_parser, "verbose", "verbose output", {'v', "verbose"});

        try
        {
            args_parser.ParseCLI(argc, argv);
        }
        catch (const args::Help&)
        {
            std::cout << args_parser;
            return 0;
        }
        catch (const args::ParseError& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << args_parser;
            return 1;
        }

        if (args::get(verbose_arg))
            peergen::set_log_level(peergen::log_level::debug);

        peergen::generator_options options;
        if (namespace_arg)
            options.output_namespace = args::get(namespace_arg);
        auto recursive_aliases = args::get(recursive_aliases_arg);
        if (!recursive_aliases.empty())
            options.recursive_aliases = std::set<std::string>(recursive_aliases.begin(), recursive_aliases.end());
        options.include_proposed = !args::get(no_proposed_arg);

        std::filesystem::path input = std::filesystem::path(args::get(input_arg)).lexically_normal();
        std::filesystem::path output_path = std::filesystem::path(args::get(output_path_arg)).lexically_normal();

        if (!std::filesystem::exists(input))
        {
            std::cerr << "Error file " << input << " does not exist" << std::endl;
            return 1;
        }

        peergen::code_generator generator(peergen::loader::load_file(input), options);
        generator.generate();

        // render everything before touching the output directory
        auto types_code = generator.types_code();
        auto initiator_code = generator.initiator_code();
        auto responder_code = generator.responder_code();

        std::filesystem::create_directories(output_path);
        write_if_different(output_path / options.types_file, types_code);
        write_if_different(output_path / options.initiator_file, initiator_code);
        write_if_different(output_path / options.responder_file, responder_code);
    }
    catch (const std::exception& e)
    {
        PEERGEN_ERROR("{}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
