#include "error.hpp"
#include "fs.hpp"
#include "num.hpp"
#include "result.hpp"

error::Result<int> run(const path::PathBuf &path)
{
    auto file = SHORT_CIRCUIT(int, fs::File::open(path).context("Could not open file"));

    std::string contents;
    SHORT_CIRCUIT(int, file.read_to_string(contents).context("Unable to read file"));

    auto value = SHORT_CIRCUIT(int, num::parse<int>(num::trim(contents)).context("Could not parse file"));
    SHORT_CIRCUIT(int, error::ensure(value != 0, "Value cannot be zero"));

    return error::Result<int>::ok(std::move(value));
}

int main(int argc, char **argv)
{
    path::PathBuf path = argc > 1 ? argv[1] : "example.txt";

    auto result = run(path);
    if (result.is_err())
    {
        const auto &err = result.unwrap_err();
        std::cerr << "Error: " << err << std::endl;
        for (const auto &cause : err.iter_causes())
        {
            std::cerr << "Caused by: " << cause << std::endl;
        }

        return 1;
    }

    std::cout << "Value = " << result.unwrap() << std::endl;
    return 0;
}
