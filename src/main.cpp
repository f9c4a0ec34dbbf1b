/*  ============================================================================================  *
 *
 *                                                               .      *        .
 *      :::::::::: :::        :::    ::: :::::::::  :::::::::  :::   :::     *
 *      :+:        :+:        :+:    :+: :+:    :+: :+:    :+: :+:   :+:  .      *   .
 *      +:+        +:+        +:+    +:+ +:+    +:+ +:+    +:+  +:+ +:+        .
 *      :#::+::#   +#+        +#+    +:+ +#++:++#:  +#++:++#:    +#++:    *        .
 *      +#+        +#+        +#+    +#+ +#+    +#+ +#+    +#+    +#+         .   *
 *      #+#        #+#        #+#    #+# #+#    #+# #+#    #+#    #+#    .
 *      ###        ########## ########   ###    ### ###    ###    ###       *    .   *
 *                                                               ______________________
 *                                << S N O W   O V E R L A Y >>
 *
 *  ============================================================================================  *
 *
 *      A snowfall overlay: flakes drift with wind and depth, shy away
 *      from the pointer, settle on page elements and melt away.
 *
 *    ----------------------------------------------------------------------
 *
 *      License:      MIT
 */
#include "AppConfig.h"
#include "SnowApp.h"
#include "Version.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <signal.h>
#include <eh.h>

/**
 * @brief Signal-based crash handler for fatal errors.
 *
 * Logs the signal number to flurry.txt before terminating.
 *
 * @param sig The signal number that triggered the crash.
 */
void CrashHandler(int sig)
{
    std::ofstream logFile("flurry.txt", std::ios::app);
    logFile << "CRASH HANDLER: Signal " << sig << std::endl;
    logFile.close();
    exit(1);
}

#endif // _WIN32

int main(int argc, char **argv)
{
    // ------------------------------------------------------------------------
    // Windows: Install Crash Handlers
    // ------------------------------------------------------------------------
#ifdef _WIN32
    signal(SIGABRT, CrashHandler);
    signal(SIGTERM, CrashHandler);

    // Translate structured exceptions (SEH) to C++ exceptions
    _set_se_translator([](unsigned int code, struct _EXCEPTION_POINTERS *ep)
                       {
        (void)ep;

        std::ofstream logFile("flurry.txt", std::ios::app);
        logFile << "SEH EXCEPTION: Code " << code << std::endl;
        logFile.close();
        throw std::runtime_error("SEH Exception"); });
#endif

    // ------------------------------------------------------------------------
    // Initialize Logging
    // ------------------------------------------------------------------------
    std::ofstream logFile("flurry.txt", std::ios::app);
    logFile << "=== flurry " << FLURRY_VERSION << " starting ===" << std::endl;

    std::cout << "=== flurry " << FLURRY_VERSION << " ===" << std::endl;

    // ------------------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------------------
    std::string configPath = (argc > 1) ? argv[1] : "config.json";

    AppConfig config;
    if (!config.LoadFromFile(configPath) && !config.LoadFromFile("../" + configPath))
    {
        std::cout << "Using built-in defaults" << std::endl;
        logFile << "Config " << configPath << " not loaded, using defaults" << std::endl;
    }

    // ------------------------------------------------------------------------
    // Initialization and Execution
    // ------------------------------------------------------------------------
    SnowApp app;

    try
    {
        if (!app.Initialize(config))
        {
            std::cerr << "Failed to initialize" << std::endl;
            logFile << "ERROR: Initialize() returned false" << std::endl;
            return EXIT_FAILURE;
        }

        app.Run();
        app.Shutdown();
        std::cout << "Shutdown complete" << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception in main: " << e.what() << std::endl;
        logFile << "EXCEPTION in main: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // ------------------------------------------------------------------------
    // Clean Exit
    // ------------------------------------------------------------------------
    logFile << "=== Program Exiting Normally ===" << std::endl;
    return EXIT_SUCCESS;
}
