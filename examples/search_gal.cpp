#include <eas/eas.hpp>
#include <eas/eas_test_support.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <name>" << std::endl;
        return EXIT_FAILURE;
    }

    int res = EXIT_SUCCESS;
    eas::set_up();

    try
    {
        const auto env = eas::test::environment();
        eas::client client(env.settings());

        const auto entries = client.search().search_gal(argv[1], 20);
        if (!entries)
        {
            throw std::runtime_error(entries.error().message());
        }
        for (const auto& entry : entries.value())
        {
            std::cout << entry.display_name << " <" << entry.email_address
                      << ">" << std::endl;
        }
    }
    catch (std::exception& exc)
    {
        std::cout << exc.what() << std::endl;
        res = EXIT_FAILURE;
    }

    eas::tear_down();
    return res;
}

// vim:et ts=4 sw=4 noic cc=80
