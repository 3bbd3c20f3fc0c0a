#include <vshadertest/line_reader.hpp>
#include <vshadertest/source.hpp>

#include <iostream>
#include <string>
#include <utility>

using namespace vshadertest;

static void usage() { std::cout << "Usage: example_preprocess_script [script.shader_test]\n"; }

int main(int argc, char** argv)
{
    if (argc > 2)
    {
        usage();
        return 1;
    }

    const std::string scriptPath = argc == 2 ? argv[1] : "scripts/fill_buffer.shader_test";

    Source source = Source::from_file(scriptPath);

    // FILL_VALUE expands to ANSWER, which is expanded again in place.
    auto r = source.add_token_replacement("BUFFER_SIZE", "256");
    if (r.isOk())
        r = source.add_token_replacement("FILL_VALUE", "ANSWER");
    if (r.isOk())
        r = source.add_token_replacement("ANSWER", "42");
    if (!r.isOk())
    {
        std::cerr << "Invalid token replacement: " << r.error().message << "\n";
        return 2;
    }

    std::cout << "Token replacements:\n";
    for (const auto& tr : source.token_replacements())
        std::cout << "  " << tr.token << " -> " << tr.replacement << "\n";

    LineReader reader(std::move(source));
    for (;;)
    {
        auto line = reader.read_line();
        if (!line.isOk())
        {
            std::cerr << "Failed to read " << scriptPath << ": " << line.error().message << "\n";
            return 3;
        }
        if (!line.value())
            break;

        std::cout << reader.line_number() << ": " << *line.value() << "\n";
    }

    std::cout << "OK: " << reader.line_number() << " lines\n";
    return 0;
}
