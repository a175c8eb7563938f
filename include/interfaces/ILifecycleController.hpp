#pragma once
#include "common/Result.hpp"

namespace interfaces {

    class ILifecycleController {
    public:
        virtual ~ILifecycleController() = default;

        // Terminate the controlled application. May not return if the
        // controlled application is this process.
        virtual common::EmptyResult terminate_application() = 0;
    };

} // namespace interfaces
