/******************************************************************************************
*                                                                                         *
*    arrowpath viewer                                                                    *
*                                                                                         *
*    Usage: arrow_viewer [config.toml]                                                   *
*    [arrow] sets up rendering, [log] sets up logging                                    *
*                                                                                         *
******************************************************************************************/

#include "arrow_viewer.hpp"
#include "arrowpath_config.hpp"
#include "arrowpath_logger.hpp"
#include <zf_log.h>

int main(int argc, char** argv)
{
    arrowpath::ArrowConfig config;
    arrowpath::LogOptions log_options;

    if (argc > 1) {
        auto loaded_log = arrowpath::load_log_options(argv[1]);
        if (loaded_log.is_err()) {
            ZF_LOGE("%s: %s", argv[1], arrowpath::to_str(loaded_log.unwrap_err()));
            return 1;
        }
        log_options = loaded_log.unwrap();
    }

    // A log file that cannot be opened is not fatal, the console still works
    auto started = arrowpath::start_logging(log_options);
    if (started.is_err()) {
        ZF_LOGW("%s", arrowpath::to_str(started.unwrap_err()));
    }

    if (argc > 1) {
        auto loaded = arrowpath::load_config(argv[1]);
        if (loaded.is_err()) {
            ZF_LOGE("%s: %s", argv[1], arrowpath::to_str(loaded.unwrap_err()));
            return 1;
        }
        config = loaded.unwrap();
    }

    arrowpath::ArrowViewer app(config);
    return app.Run() ? 0 : 1;
}
