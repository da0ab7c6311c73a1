/**
 * @file sample_module.cpp
 * @brief Plugin module loaded by the end-to-end tests
 *
 * Built as libwarden_sample.so; called as module "warden_sample".
 */

#include "warden/plugin/plugin_api.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

WARDEN_FUNCTION(add) {
    result = ctx.Args().at(0).get<long long>() + ctx.Args().at(1).get<long long>();
}

WARDEN_FUNCTION(greet) {
    auto name = ctx.Kwargs().value("name", std::string("world"));
    std::cout << "greeting " << name << std::endl;
    result = "hello, " + name;
}

WARDEN_FUNCTION(boom) {
    throw std::runtime_error("boom: " + ctx.Kwargs().value("reason", std::string("requested")));
}

WARDEN_FUNCTION(allocate) {
    const auto megabytes = ctx.Args().at(0).get<std::size_t>();
    std::vector<char> block(megabytes * 1024 * 1024);
    std::memset(block.data(), 1, block.size());
    result = block.size();
}

WARDEN_FUNCTION(read_file) {
    result = ctx.ReadFile(ctx.Args().at(0).get<std::string>());
}

WARDEN_FUNCTION(write_file) {
    ctx.WriteFile(ctx.Args().at(0).get<std::string>(), ctx.Args().at(1).get<std::string>());
    result = true;
}

WARDEN_FUNCTION(cwd) {
    result = ctx.WorkingDirectory().string();
}

class Counter : public warden::plugin::Object {
public:
    Counter() {
        methods_.Register("increment", [](Counter& self, warden::plugin::CallContext& ctx,
                                          nlohmann::json& result) {
            self.value_ += ctx.Kwargs().value("step", 1);
            result = self.value_;
        });
        methods_.Register("describe", [](Counter& self, warden::plugin::CallContext&,
                                         nlohmann::json& result) {
            result = {{"value", self.value_}};
        });
    }

    bool HasMethod(const std::string& name) const override { return methods_.Has(name); }

    void Invoke(const std::string& name, warden::plugin::CallContext& ctx,
                nlohmann::json& result) override {
        methods_.Call(*this, name, ctx, result);
    }

private:
    warden::plugin::MethodTable<Counter> methods_;
    int value_{0};
};

WARDEN_CLASS(Counter)
