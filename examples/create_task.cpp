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

        auto task = eas::task();
        task.subject = "Something important to do";
        task.body = "Some descriptive body text";
        task.due_date = eas::date_time("2026-01-16T12:30:00Z");
        task.priority = eas::importance::high;

        const auto created = client.tasks().create_task(task);
        if (!created)
        {
            throw std::runtime_error(created.error().message());
        }
        std::cout << created.value() << std::endl;
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
