#pragma once

#include "TendaEngine.hpp"

#include <memory>

namespace tenda {

class Prelude
{
public:
    static void install(Engine &engine);

    // Process-wide registry, built once on first use and never modified
    static std::shared_ptr<const Environment> bindings();

private:
    static std::shared_ptr<const Environment> build();

    static void registerCoreFunctions(Environment &env);
    static void registerIOFunctions(Environment &env);
    static void registerListFunctions(Environment &env);
    static void registerTextFunctions(Environment &env);
    static void registerMathFunctions(Environment &env);
    static void registerErrorFunctions(Environment &env);
};

} // namespace tenda
