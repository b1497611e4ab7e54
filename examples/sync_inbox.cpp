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

        const auto inbox =
            client.folders().find_folder(eas::folder_type::inbox);
        if (!inbox)
        {
            throw std::runtime_error(inbox.error().message());
        }

        auto more = true;
        while (more)
        {
            const auto batch = client.mail().sync_messages(
                inbox.value(), [](const eas::mail_changes& changes) {
                    for (const auto& msg : changes.upserted)
                    {
                        std::cout << msg.server_id << ": " << msg.subject
                                  << std::endl;
                    }
                    for (const auto& id : changes.deleted)
                    {
                        std::cout << id << " deleted" << std::endl;
                    }
                });
            if (!batch)
            {
                throw std::runtime_error(batch.error().message());
            }
            more = batch.value();
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
