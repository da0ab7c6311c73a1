/**
 * @file plugin_api.hpp
 * @brief ABI for modules callable through library_call and module_call
 *
 * A module is a shared object exporting C-linkage entry points. Functions are
 * exported with WARDEN_FUNCTION, classes with WARDEN_CLASS:
 *
 * @code
 * #include <warden/plugin/plugin_api.hpp>
 *
 * WARDEN_FUNCTION(add) {
 *     result = ctx.Args().at(0).get<int>() + ctx.Args().at(1).get<int>();
 * }
 *
 * class Counter : public warden::plugin::Object {
 * public:
 *     Counter() {
 *         methods_.Register("increment", [](Counter& self, warden::plugin::CallContext& ctx,
 *                                           nlohmann::json& result) {
 *             self.value_ += ctx.Kwargs().value("step", 1);
 *             result = self.value_;
 *         });
 *     }
 *     bool HasMethod(const std::string& name) const override { return methods_.Has(name); }
 *     void Invoke(const std::string& name, warden::plugin::CallContext& ctx,
 *                 nlohmann::json& result) override { methods_.Call(*this, name, ctx, result); }
 * private:
 *     warden::plugin::MethodTable<Counter> methods_;
 *     int value_{0};
 * };
 * WARDEN_CLASS(Counter)
 * @endcode
 *
 * Plugins must not write to files directly when the sandbox runs without OS
 * filesystem isolation; CallContext::ReadFile and WriteFile go through the
 * allow-list.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace warden {
namespace plugin {

/**
 * @class CallContext
 * @brief Arguments and guarded capabilities handed to a plugin call
 */
class CallContext {
public:
    virtual ~CallContext() = default;

    /// Positional arguments (JSON array)
    virtual const nlohmann::json& Args() const = 0;

    /// Keyword arguments (JSON object)
    virtual const nlohmann::json& Kwargs() const = 0;

    virtual std::filesystem::path WorkingDirectory() const = 0;

    /**
     * @brief Read a file through the sandbox allow-list
     * @throws warden::core::SecurityViolation when access is denied
     */
    virtual std::string ReadFile(const std::filesystem::path& path) const = 0;

    /**
     * @brief Write a file through the sandbox allow-list
     * @throws warden::core::SecurityViolation when access is denied
     */
    virtual void WriteFile(const std::filesystem::path& path, const std::string& content,
                           bool append = false) const = 0;
};

/**
 * @class Object
 * @brief Instance created by a WARDEN_CLASS factory
 */
class Object {
public:
    virtual ~Object() = default;

    virtual bool HasMethod(const std::string& name) const = 0;

    /**
     * @brief Invoke a method by name
     * @throws std::invalid_argument for unknown methods
     */
    virtual void Invoke(const std::string& name, CallContext& ctx, nlohmann::json& result) = 0;
};

/**
 * @class MethodTable
 * @brief Name to member-callable table for Object implementations
 */
template <typename T>
class MethodTable {
public:
    using Method = std::function<void(T&, CallContext&, nlohmann::json&)>;

    void Register(const std::string& name, Method method) {
        methods_[name] = std::move(method);
    }

    bool Has(const std::string& name) const {
        return methods_.count(name) > 0;
    }

    void Call(T& self, const std::string& name, CallContext& ctx, nlohmann::json& result) const {
        auto it = methods_.find(name);
        if (it == methods_.end()) {
            throw std::invalid_argument("No such method: " + name);
        }
        it->second(self, ctx, result);
    }

private:
    std::map<std::string, Method> methods_;
};

/// Signature of an exported function
using FunctionEntry = void (*)(CallContext&, nlohmann::json&);

/// Signature of an exported class factory
using ClassFactory = Object* (*)();

constexpr const char* kFunctionPrefix = "warden_fn_";
constexpr const char* kClassPrefix = "warden_class_";

} // namespace plugin
} // namespace warden

/**
 * @brief Define and export a function `name`
 *
 * The body sees `ctx` (CallContext&) and assigns its return value to
 * `result` (nlohmann::json&). Exceptions propagate to the launcher and are
 * reported as the call's error.
 */
#define WARDEN_FUNCTION(name)                                                       \
    extern "C" __attribute__((visibility("default")))                              \
    void warden_fn_##name(::warden::plugin::CallContext& ctx, nlohmann::json& result)

/**
 * @brief Export a no-argument factory for class `Type`
 *
 * The launcher owns the returned instance.
 */
#define WARDEN_CLASS(Type)                                                          \
    extern "C" __attribute__((visibility("default")))                              \
    ::warden::plugin::Object* warden_class_##Type() { return new Type(); }
