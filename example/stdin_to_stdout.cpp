#include "streambridge/streambridge.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <functional>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>
#include <thread>
#include <unistd.h>

namespace {

streambridge::runtime::task<void>
copy_to_stdout(std::shared_ptr<streambridge::stage_controller> stage,
               streambridge::runtime::event_loop& loop, int& exit_code) {
    streambridge::chunk_reader reader{std::move(stage), loop};
    while (true) {
        auto next = co_await reader.next();
        if (!next.has_value()) {
            std::cerr << "stream failed: " << next.error().message() << '\n';
            exit_code = 1;
            co_return;
        }
        if (!next->has_value()) {
            break;
        }

        const auto bytes = (*next)->bytes();
        if (std::fwrite(bytes.data(), 1, bytes.size(), stdout) !=
            bytes.size()) {
            std::cerr << "stdout write failed\n";
            exit_code = 1;
            reader.cancel();
            co_return;
        }
    }
    std::fflush(stdout);
}

void copy_from_stdin(streambridge::blocking_writer writer, int& exit_code) {
    std::array<std::byte, 4096> buffer{};
    while (true) {
        const auto count = ::read(STDIN_FILENO, buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "stdin read failed: "
                      << streambridge::make_error_from_errno(errno).message()
                      << '\n';
            exit_code = 1;
            break;
        }
        if (count == 0) {
            break;
        }

        const auto written = writer.write(
            buffer, 0, static_cast<std::size_t>(count));
        if (!written.has_value()) {
            std::cerr << "write failed: " << written.error().message() << '\n';
            exit_code = 1;
            return;
        }
    }

    const auto closed = writer.close();
    if (!closed.has_value()) {
        std::cerr << "close failed: " << closed.error().message() << '\n';
        exit_code = 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2 || (argc == 2 && std::string_view{argv[1]} != "--debug")) {
        std::cerr << "usage: stdin_to_stdout [--debug]\n";
        return 2;
    }
    spdlog::set_level(argc == 2 ? spdlog::level::debug : spdlog::level::warn);

    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    if (!loop.valid()) {
        std::cerr << "failed to initialize event loop\n";
        return 1;
    }

    streambridge::source_options options;
    options.name = "stdin";
    auto source = streambridge::make_output_stream_source(loop, pool, options);
    if (!source.has_value()) {
        std::cerr << "failed to create source: " << source.error().message()
                  << '\n';
        return 1;
    }

    int reader_exit = 0;
    int writer_exit = 0;
    loop.spawn(copy_to_stdout(source->stage, loop, reader_exit));
    std::thread producer(copy_from_stdin, std::move(source->writer),
                         std::ref(writer_exit));

    const auto run_result = loop.run();
    producer.join();
    if (!run_result.has_value()) {
        std::cerr << "event loop failed: " << run_result.error().message()
                  << '\n';
        return 1;
    }
    return reader_exit != 0 ? reader_exit : writer_exit;
}
