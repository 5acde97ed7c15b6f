#include "cpeip/eip_client.hpp"
#include "cpeip/logging.hpp"
#include "cpeip/session_config.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

void printValue(const cpeip::VariableValue& value) {
    std::visit([](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            std::cout << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, std::vector<cpeip::ElementValue>>) {
            std::cout << "[" << v.size() << " elements]";
        } else if constexpr (std::is_same_v<T, std::vector<std::uint8_t>>) {
            std::cout << "<" << v.size() << " bytes>";
        } else if constexpr (std::is_same_v<T, std::int8_t> || std::is_same_v<T, std::uint8_t>) {
            std::cout << static_cast<int>(v);
        } else {
            std::cout << v;
        }
    }, value);
    std::cout << std::endl;
}

} // namespace

// 使い方: eip_client <host> [variable]
int main(int argc, char* argv[]) {
    using namespace cpeip;

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <host> [variable]" << std::endl;
        return 2;
    }

    log::init("eip_client", "", log::Level::Info);

    SessionConfig config{};
    config.host = argv[1];

    try {
        EipClient client;
        client.connect(config);

        const auto registry = client.discover();
        for (const auto& name : registry->userVariables()) {
            std::cout << name << " : " << typeName(registry->lookup(name).type.code) << std::endl;
        }
        for (const auto& entry : registry->unresolved()) {
            std::cout << entry.first << " : (unresolved) " << entry.second << std::endl;
        }

        if (argc >= 3) {
            std::cout << argv[2] << " = ";
            printValue(client.readVariable(argv[2]));
        }

        client.close();
    } catch (const std::exception& e) {
        CPEIP_LOG_ERROR("eip_client failed: ", e.what());
        return 1;
    }
    return 0;
}
