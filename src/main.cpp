#include "Application.h"
#include "Lib/GeneralUtils.h"

auto main() -> int
{
    try {
        auto application = createApplication();

        // Serve the staging API until the process is stopped
        application->run();
    } catch (std::exception& e) {
        dumpExceptions(e);
        return 1;
    }

    return 0;
}
