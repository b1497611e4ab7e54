#include <eas/eas.hpp>
#include <eas/eas_test_support.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>

int main()
{
    int res = EXIT_SUCCESS;
    eas::set_up();

    try
    {
        const auto env = eas::test::environment();
        eas::client client(env.settings());

        const auto version = client.detect_version();
        if (version)
        {
            std::cout << "Protocol version " << version.value() << std::endl;
        }

        const auto notes = client.notes().sync_notes();
        if (!notes)
        {
            throw std::runtime_error(notes.error().message());
        }
        for (const auto& n : notes.value())
        {
            std::cout << n.server_id << ": " << n.subject;
            if (n.is_deleted)
            {
                std::cout << " (deleted)";
            }
            std::cout << std::endl;
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
