#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include "edn/edn.hpp"

// 1-based line and column of a byte offset.
static std::pair<int, int> lineAndColumn(const std::string &contents, std::size_t position)
{
    int line = 1;
    int column = 1;
    for (std::size_t i = 0; i < position && i < contents.size(); ++i)
    {
        if (contents[i] == '\n')
        {
            line++;
            column = 1;
        }
        else
        {
            column++;
        }
    }
    return {line, column};
}

int main(int argc, char *argv[])
{
    cxxopts::Options options("datomic-edn", "Read EDN forms and write them back in normalised form");
    options.add_options()("h,help", "Print usage")("f,filename", "The EDN file to read", cxxopts::value<std::string>())("d,max-depth", "Maximum collection nesting depth", cxxopts::value<int>()->default_value(std::to_string(datomic::edn::defaultMaxDepth)))("p,pretty", "Pretty-print each form");

    try
    {
        auto result = options.parse(argc, argv);
        if (result.count("help"))
        {
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (!result.count("filename"))
        {
            std::cerr << "No filename provided." << std::endl;
            return 1;
        }

        std::string filename = result["filename"].as<std::string>();
        std::ifstream file(filename, std::ios::binary);
        if (!file)
        {
            std::cerr << "Failed to open file: " << filename << std::endl;
            return 1;
        }
        std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        datomic::edn::ReadOptions readOptions;
        readOptions.maxDepth = result["max-depth"].as<int>();
        bool pretty = result.count("pretty") > 0;

        try
        {
            datomic::edn::Reader reader(contents, readOptions);
            while (!reader.atEnd())
            {
                datomic::edn::Value value = reader.readValue();
                std::cout << (pretty ? datomic::edn::pprint(value) : datomic::edn::write(value)) << std::endl;
            }
        }
        catch (const datomic::edn::EdnException &e)
        {
            if (e.position())
            {
                auto [line, column] = lineAndColumn(contents, *e.position());
                std::cerr << fmt::format("{}({},{}) : error: {}", filename, line, column, e.what()) << std::endl;
            }
            else
            {
                std::cerr << fmt::format("{} : error: {}", filename, e.what()) << std::endl;
            }
            return 1;
        }
    }
    catch (const cxxopts::exceptions::exception &e)
    {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
