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

        auto folders = client.folders().sync_folders();
        if (!folders && folders.error().code() ==
                            eas::error_code::provisioning_required)
        {
            const auto key = client.provision();
            if (!key)
            {
                throw std::runtime_error(key.error().message());
            }
            folders = client.folders().sync_folders();
        }
        if (!folders)
        {
            throw std::runtime_error(folders.error().message());
        }

        for (const auto& f : folders.value())
        {
            std::cout << f.server_id << "\t" << f.display_name << "\t"
                      << eas::internal::enum_to_str(f.type) << std::endl;
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
