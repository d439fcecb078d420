#include <nlohmann/json.hpp>

#include "error.hpp"
#include "fs.hpp"
#include "num.hpp"
#include "result.hpp"
#include "terminator.hpp"

using json = nlohmann::json;

struct Settings
{
    path::PathBuf value_file;
    int minimum;
};

error::Result<Settings> load_settings(const path::PathBuf &path)
{
    auto contents = SHORT_CIRCUIT(
        Settings,
        fs::read_to_string(path).with_context([&path]()
                                              { return stringify("Unable to read ", path.string()); }));

    auto parsed = json::parse(contents, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return error::bail<Settings>("Settings must be a JSON object");
    }

    try
    {
        Settings settings{parsed.value("value_file", std::string("example.txt")), parsed.value("minimum", 1)};
        return error::Result<Settings>::ok(std::move(settings));
    }
    catch (const json::exception &)
    {
        return error::Result<Settings>::err(error::ContextError("Invalid settings", error::ExceptionError::current()));
    }
}

error::Result<int> from_file(const path::PathBuf &path)
{
    auto contents = SHORT_CIRCUIT(int, fs::read_to_string(path).context("Could not open file"));
    return num::parse<int>(num::trim(contents)).context("Could not parse file");
}

error::Result<std::monostate> validate(int value, int minimum)
{
    SHORT_CIRCUIT(
        std::monostate,
        error::ensure(value >= minimum, stringify("Value must be at least ", minimum, " (found ", value, ")")));

    if (value % 2 != 0)
    {
        return error::bail("Only even numbers can be used");
    }

    return error::Result<std::monostate>::ok(std::monostate{});
}

result::Result<std::monostate, error::Terminator> run(const path::PathBuf &settings_path)
{
    auto settings = SHORT_CIRCUIT(
        std::monostate,
        load_settings(settings_path).context("Unable to load settings").into_terminator());

    auto value = SHORT_CIRCUIT(
        std::monostate,
        from_file(settings.value_file).context("Unable to get value from file").into_terminator());

    SHORT_CIRCUIT(
        std::monostate,
        validate(value, settings.minimum).context("Value is not acceptable").into_terminator());

    std::cout << "Value = " << value << std::endl;
    return result::Result<std::monostate, error::Terminator>::ok(std::monostate{});
}

int main(int argc, char **argv)
{
    path::PathBuf settings_path = argc > 1 ? argv[1] : "settings.json";
    return error::terminate([&settings_path]()
                            { return run(settings_path); });
}
