#pragma once
#include <string>
#include <vector>
#include "protocol/backend_descriptor.hpp"

#ifndef MCPROXY_FAKE_BACKEND_PATH
#error "MCPROXY_FAKE_BACKEND_PATH must point at the fake backend executable"
#endif

namespace mcproxy::test_support {

    // Descriptor launching tests/fixtures/fake_backend.cpp under `name`.
    inline protocol::BackendDescriptor fake_backend(const std::string& name,
                                                    std::vector<std::string> extra_args = {}) {
        protocol::BackendDescriptor descriptor;
        descriptor.name = name;
        descriptor.command = std::vector<std::string>{MCPROXY_FAKE_BACKEND_PATH};
        descriptor.args = {"--name", name};
        descriptor.args.insert(descriptor.args.end(), extra_args.begin(), extra_args.end());
        descriptor.description = "fake backend " + name;
        return descriptor;
    }

} // namespace mcproxy::test_support
