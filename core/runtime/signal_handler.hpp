#pragma once

#include <atomic>

namespace itemstore
{
    namespace runtime
    {

        // SIGINT/SIGTERM set a flag; the main thread polls it and runs the shutdown
        class SignalHandler
        {
        public:
            static void install();
            static bool is_shutdown_requested();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace itemstore
