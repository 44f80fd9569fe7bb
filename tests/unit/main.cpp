#include <iostream>

#include <spdlog/spdlog.h>

void run_ignore_tests();
void run_config_tests();
void run_scheduler_tests();
void run_transfer_task_tests();
void run_file_service_tests();
void run_transfer_handlers_tests();
void run_cli_options_tests();

int main()
{
    spdlog::set_level(spdlog::level::warn);
    try
    {
        run_ignore_tests();
        run_config_tests();
        run_scheduler_tests();
        run_transfer_task_tests();
        run_file_service_tests();
        run_transfer_handlers_tests();
        run_cli_options_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
