#include "dispatcher.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <chrono>
#include <fmt/format.h>

namespace geomill {

OperationResult error_result(const std::string& message) {
    OperationResult result;
    result.config.set(keys::ERROR_KEY, message);
    return result;
}

Dispatcher::Dispatcher(const OperationRegistry& registry, std::optional<DataLogger> data_logger)
    : registry_(registry), data_logger_(std::move(data_logger)) {}

OperationResult Dispatcher::execute(const Operation& op, const ConfigMap& config,
                                    const GeometryBuffer& input) const {
    return execute_operation(op, config, input);
}

OperationResult Dispatcher::process(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();
    try {
        return run(config, input);
    } catch (const ValidationError& e) {
        log->warn("validation error ({}): {}", e.key(), e.what());
        return error_result(e.what());
    } catch (const Error& e) {
        log->warn("{} error: {}", e.kind(), e.what());
        return error_result(e.what());
    } catch (const std::exception& e) {
        log->error("unexpected failure: {}", e.what());
        return error_result(fmt::format("internal failure: {}", e.what()));
    }
}

OperationResult Dispatcher::run(const ConfigMap& config, const GeometryBuffer& input) const {
    auto log = logging::get_logger();

    if (data_logger_) {
        data_logger_->record(config, input);
    }

    auto command = config.get(keys::COMMAND);
    if (!command) {
        throw DispatchError("missing command");
    }
    const Operation* op = registry_.find(*command);
    if (!op) {
        throw DispatchError("unknown command: " + *command);
    }

    log->info("{}: {} vertices, {} indices, {} matrices, {} config keys", *command,
              input.vertices.size(), input.indices.size(), input.matrix_count(), config.size());
    auto start = std::chrono::steady_clock::now();

    validate_operation(*op, config);
    OperationResult result;
    // Back-end exceptions that are not geomill::Error become internal failures
    try {
        result = execute(*op, config, input);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        log->error("{}: back-end failure: {}", *command, e.what());
        throw ExecutionError(fmt::format("{}: internal failure: {}", *command, e.what()));
    }

    if (auto violation = result.geometry.find_violation(true)) {
        throw ExecutionError(fmt::format("{}: produced invalid geometry: {}", *command, *violation));
    }
    if (result.config.has(keys::ERROR_KEY)) {
        throw ExecutionError(fmt::format("{}: reported error: {}", *command, *result.config.get(keys::ERROR_KEY)));
    }

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    log->info("{}: {} vertices, {} indices, {} matrices out in {:.2f} ms", *command,
              result.geometry.vertices.size(), result.geometry.indices.size(),
              result.geometry.matrix_count(), elapsed.count());
    return result;
}

}  // namespace geomill
