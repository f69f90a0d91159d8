#include "ConsoleUtils.hpp"
#include "TypingConsole.hpp"
#include "codetyper/core/Utf8.hpp"
#include "codetyper/generation/CodeSourceService.hpp"
#include "codetyper/generation/Language.hpp"
#include "codetyper/generation/SampleSnippets.hpp"
#include "codetyper/generation/providers/InferenceProviderFactory.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace
{

constexpr int g_defaultDurationSeconds{ 60 };
constexpr int g_maxDurationSeconds{ 3600 };

struct Options final
{
    std::string language{ "py" };
    int durationSeconds{ g_defaultDurationSeconds };
    codetyper::generation::providers::InferenceConfig inference{};
    bool offline{ false };
    bool showSnippet{ false };
};

std::string acquireSnippet(const Options& options, codetyper::generation::Language language)
{
    if (options.offline)
    {
        return std::string{ codetyper::generation::builtinSnippet(language) };
    }

    auto provider{ codetyper::generation::providers::makeInferenceCodeProvider(options.inference) };
    codetyper::generation::CodeSourceService source{ *provider, options.inference.band };

    std::cerr << "Generating " << codetyper::generation::displayName(language) << " code...\n";
    auto result{ source.acquireSnippet(language) };
    if (result.warning.has_value())
    {
        std::cerr << "warning: " << *result.warning << "\n";
    }
    std::cerr << "source: " << codetyper::generation::toString(result.origin) << "\n";
    return std::move(result.text);
}

} // namespace

int main(int argc, char* argv[])
{
    Options options{};

    CLI::App app{ "CodeTyper - practice typing real code in the terminal" };
    app.add_option("-l,--language", options.language, "Language: py, cpp, java, rust, javascript")
        ->capture_default_str();
    app.add_option("-d,--duration", options.durationSeconds, "Session length in seconds")
        ->check(CLI::Range(1, g_maxDurationSeconds))
        ->capture_default_str();
    app.add_option("--api-key", options.inference.apiKey, "Code generator API key")->envname("CODETYPER_API_KEY");
    app.add_option("--model", options.inference.model, "Generator model")->capture_default_str();
    app.add_option("--host", options.inference.host, "Generator host")->capture_default_str();
    app.add_option("--path", options.inference.path, "Chat completion endpoint path")->capture_default_str();
    app.add_flag("--offline", options.offline, "Use the built-in sample instead of generating code");
    app.add_flag("--show-snippet", options.showSnippet, "Print the snippet and exit");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    const auto language{ codetyper::generation::parseLanguage(options.language) };
    if (!language.has_value())
    {
        std::cerr << "error: unknown language '" << options.language << "'\n";
        return 2;
    }

    try
    {
        const std::string snippet{ acquireSnippet(options, *language) };

        if (options.showSnippet)
        {
            std::cout << snippet;
            return 0;
        }

        if (!codetyper::ui::cli::stdinIsTerminal())
        {
            std::cerr << "error: practice mode needs an interactive terminal\n";
            return 2;
        }

        codetyper::ui::cli::RawModeGuard rawMode{};
        codetyper::ui::cli::TypingConsole console{ std::cout, codetyper::ui::cli::readStdinByte };
        const auto summary{ console.run(codetyper::core::decodeUtf8(snippet),
                                        std::chrono::seconds{ options.durationSeconds }) };

        codetyper::ui::cli::printSummary(std::cout, summary);
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
