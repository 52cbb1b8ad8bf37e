#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace covertrax {
    namespace utils {

        /**
         * @brief Owns worker threads and joins every started one when it goes out of scope
         *
         * A spawn that throws part way leaves the threads already started
         * joinable, so they are still joined on the exception path.
         */
        class ThreadGroup {
          public:
            ThreadGroup() = default;
            ThreadGroup(const ThreadGroup &) = delete;
            ThreadGroup &operator=(const ThreadGroup &) = delete;

            ~ThreadGroup() { join(); }

            template <typename F, typename... Args> void spawn(F &&f, Args &&...args) {
                threads_.emplace_back(std::forward<F>(f), std::forward<Args>(args)...);
            }

            void join() {
                for (auto &t : threads_) {
                    if (t.joinable()) {
                        t.join();
                    }
                }
                threads_.clear();
            }

            std::size_t size() const { return threads_.size(); }

          private:
            std::vector<std::thread> threads_;
        };

    } // namespace utils
} // namespace covertrax
