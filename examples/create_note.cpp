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

        const auto created = client.notes().create_note(
            "Shopping list", "Milk, eggs and bread",
            eas::category_set{"Personal"});
        if (!created)
        {
            throw std::runtime_error(created.error().message());
        }
        std::cout << "Created note " << created.value() << std::endl;
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
