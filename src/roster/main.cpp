// Claims an application instance ID from a namespace on a shared filesystem and holds it until told to shut down.
// Hosts that cannot link the library can wrap their process with this: the ID is printed on stdout as soon as it is
// acquired, and the record is released on SIGTERM or SIGINT.

#include "Configuration.hpp"
#include "DirectoryObjectStore.hpp"
#include "Errors.hpp"
#include "GapScan.hpp"
#include "InstanceIdAllocator.hpp"
#include "Logger.hpp"
#include "SignalShutdownNotifier.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <lyra/lyra.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

template <>
struct fmt::formatter<lyra::cli> : ostream_formatter {};

namespace roster {

namespace {

enum class ExitCode { Ok = 0, Error = 1, NamespaceCorrupt = 2, IdSpaceExhausted = 3, StoreFault = 4 };

int exit_code(ExitCode code) { return magic_enum::enum_integer(code); }

void list_ids(DirectoryObjectStore &store) {
    store.ensure_namespace();
    const auto names = store.list_record_names();
    std::vector<InstanceId> ids;
    for (const auto &name : names) {
        if (auto id = parse_record_name(name))
            ids.push_back(*id);
        else
            fmt::print("foreign record: {}\n", name);
    }
    std::sort(ids.begin(), ids.end());
    fmt::print("claimed: {}\n", fmt::join(ids, " "));
    fmt::print("next free: {}\n", find_smallest_free_id(names));
}

int Main(Logger &log, int argc, char *argv[]) {
    bool help = false;
    bool debug = false;
    bool list = false;
    bool once = false;
    std::string store_dir;
    std::string namespace_name;
    std::string application_name;
    auto cli = lyra::cli()
               | lyra::help(help).description("Claims an application instance ID and holds it until shutdown.")
               | lyra::opt(debug)["-d"]["--debug"]("enable debugging")
               | lyra::opt(store_dir, "dir")["--store-dir"]("directory holding the namespaces (or $ROSTER_STORE_DIR)")
               | lyra::opt(namespace_name, "name")["--namespace"]("namespace to claim the ID in")
               | lyra::opt(application_name, "name")["--app-name"]("application name recorded with the claim")
               | lyra::opt(list)["--list"]("show the claimed IDs and the next free one, then exit")
               | lyra::opt(once)["--once"]("release the ID as soon as it is acquired");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.message());
        return exit_code(ExitCode::Error);
    } else if (help) {
        fmt::print("{}", cli);
        return exit_code(ExitCode::Ok);
    }

    if (debug) {
        log.info("Debugging logging enabled");
        set_log_level(spdlog::level::debug);
    }

    const auto config = store_dir.empty() ? Configuration() : Configuration(store_dir);
    store_dir = config.store_dir();
    if (namespace_name.empty())
        namespace_name = config.namespace_name();
    if (application_name.empty())
        application_name = config.application_name();

    // Before any threads exist, so that none of them receive the shutdown signals directly.
    SignalShutdownNotifier shutdown;
    DirectoryObjectStore store(store_dir, namespace_name);
    if (list) {
        list_ids(store);
        return exit_code(ExitCode::Ok);
    }

    InstanceIdAllocator allocator(store, shutdown,
                                  [&application_name] { return RecordMetadata::for_this_process(application_name); });
    const auto id = allocator.acquire();
    fmt::print("{}\n", id);
    std::fflush(stdout);

    if (once) {
        allocator.release();
    } else {
        log.info("Holding application instance ID {} in {} until shutdown", id, store.namespace_dir().string());
        shutdown.wait();
    }
    return exit_code(ExitCode::Ok);
}

}

}

int main(int argc, char *argv[]) {
    using namespace roster;
    auto log = logger_for("main");
    try {
        return Main(log, argc, argv);
    } catch (const NamespaceCorruptError &e) {
        log.error("{} - remove it by hand", e.what());
        return exit_code(ExitCode::NamespaceCorrupt);
    } catch (const IdSpaceExhaustedError &e) {
        log.error("{}", e.what());
        return exit_code(ExitCode::IdSpaceExhausted);
    } catch (const StoreError &e) {
        log.error("{}", e.what());
        return exit_code(ExitCode::StoreFault);
    } catch (const std::runtime_error &re) {
        log.error("{}", re.what());
        return exit_code(ExitCode::Error);
    } catch (const std::invalid_argument &ia) {
        log.error("{}", ia.what());
        return exit_code(ExitCode::Error);
    }
}
