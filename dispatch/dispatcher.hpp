#ifndef GEOMILL_DISPATCH_DISPATCHER_HPP
#define GEOMILL_DISPATCH_DISPATCHER_HPP

#include <dispatch/data_logger.hpp>
#include <operations/operation_registry.hpp>
#include <optional>
#include <string>

namespace geomill {

// Result carrying only `error` and no geometry
OperationResult error_result(const std::string& message);

inline bool is_error(const OperationResult& result) {
    return result.config.has(keys::ERROR_KEY);
}

// Routes one call to its operation: read `command`, look it up, validate,
// execute. Never throws; every failure becomes an error result.
class Dispatcher {
public:
    explicit Dispatcher(const OperationRegistry& registry = OperationRegistry::instance(),
                        std::optional<DataLogger> data_logger = DataLogger::from_environment());
    virtual ~Dispatcher() = default;

    OperationResult process(const ConfigMap& config, const GeometryBuffer& input) const;

protected:
    // Runs a validated operation. Exceptions that are not geomill::Error are
    // reported as internal failures.
    virtual OperationResult execute(const Operation& op, const ConfigMap& config,
                                    const GeometryBuffer& input) const;

private:
    OperationResult run(const ConfigMap& config, const GeometryBuffer& input) const;

    const OperationRegistry& registry_;
    std::optional<DataLogger> data_logger_;
};

}  // namespace geomill

#endif // GEOMILL_DISPATCH_DISPATCHER_HPP
