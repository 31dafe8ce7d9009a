// ==============================================================================
// Wtlfo Test Main
// ==============================================================================
// Provides Catch2 main() function for the engine test executable.
// ==============================================================================

#include <catch2/catch_session.hpp>

// The VST3 SDK libraries reference moduleHandle; a plugin gets it from its
// DLL entry point, the test executable has none.
void* moduleHandle = nullptr;

int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
