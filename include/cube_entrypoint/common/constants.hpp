#pragma once

#include <string>
#include <vector>
#include <array>
#include <sys/types.h>

namespace cube_entrypoint {
namespace constants {

namespace version {
    constexpr const char* ENTRYPOINT_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("cube-entrypoint v") + ENTRYPOINT_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "cube-entrypoint";
    constexpr const char* DEFAULT_CONFIG_FILE = "/etc/cube-entrypoint/entrypoint.toml";
    constexpr const char* SELF_EXE_LINK = "/proc/self/exe";
    constexpr uid_t ROOT_UID = 0;
}

namespace env_vars {
    constexpr const char* CONFIG_FILE = "CUBE_ENTRYPOINT_CONFIG";
    constexpr const char* LOG_LEVEL = "CUBE_ENTRYPOINT_LOG_LEVEL";
    constexpr const char* SKIP_DB = "SKIP_DB";
    constexpr const char* DB_DATA_DIR = "DB_DATA_DIR";
    constexpr const char* DB_ROLE = "DB_ROLE";
    constexpr const char* DB_BIN_DIR = "DB_BIN_DIR";
    constexpr const char* RUNNER_USER = "RUNNER_USER";
    constexpr const char* PYENV = "PYENV";
    constexpr const char* VIRTUAL_ENV = "VIRTUAL_ENV";
    constexpr const char* GDAL_DATA = "GDAL_DATA";
    constexpr const char* PATH = "PATH";
    constexpr const char* PYTHONHOME = "PYTHONHOME";
    constexpr const char* HOME = "HOME";
    constexpr const char* USER = "USER";
    constexpr const char* LOGNAME = "LOGNAME";
}

namespace database {
    constexpr const char* DEFAULT_DATA_DIR = "/srv/postgresql";
    constexpr const char* DEFAULT_SERVICE_USER = "postgres";
    constexpr const char* INSTALL_ROOT = "/usr/lib/postgresql";
    constexpr const char* INIT_MARKER = "PG_VERSION";
    constexpr const char* LOG_FILE = "pg.log";
    constexpr const char* ENCODING = "UTF8";
    constexpr const char* HOST_AUTH_METHOD = "md5";
    constexpr const char* SKIP_VALUE = "yes";

    constexpr std::array<const char*, 2> FIXED_DATABASES = {"datacube", "agdcintegration"};
}

namespace identity {
    constexpr const char* DEFAULT_RUNNER_USER = "runner";
}

namespace environment {
    constexpr const char* DEFAULT_ROOT = "/env";
    constexpr const char* ACTIVATION_MARKER = "bin/activate";
    constexpr const char* MANIFEST = "setup.py";
    constexpr const char* DEFAULT_DRIVER_MANIFEST = "tests/drivers/fail_drivers";
    constexpr const char* GDAL_DATA_DIRNAME = "gdal_data";
    constexpr const char* GDAL_CONFIG = "gdal-config";
    constexpr const char* RASTERIO_LOCATOR =
        "import os, rasterio; print(os.path.dirname(rasterio.__file__))";

    constexpr std::array<const char*, 6> DEFAULT_EXTRAS = {
        "test", "cf", "celery", "s3", "performance", "distributed"
    };

    inline std::vector<std::string> getDefaultExtras() {
        return std::vector<std::string>(DEFAULT_EXTRAS.begin(), DEFAULT_EXTRAS.end());
    }
}

namespace integration {
    constexpr const char* CONFIG_FILENAME = ".datacube_integration.conf";
    constexpr const char* DATABASE = "agdcintegration";
    constexpr const char* DEFAULT_PROFILE = "datacube";
    constexpr const char* DEFAULT_DRIVER = "default";
    constexpr const char* BROKEN_PROFILE = "no_such_driver_env";
    constexpr const char* BROKEN_DRIVER = "no_such_driver";
}

namespace exit_codes {
    constexpr int SUCCESS = 0;
    constexpr int BOOTSTRAP_FAILED = 1;
    constexpr int EXEC_FAILED = 126;
    constexpr int COMMAND_NOT_FOUND = 127;
}

namespace messages {
    constexpr const char* DB_LAUNCH_WARNING = "failed to launch db, things might not work";
    constexpr const char* ROOT_WARNING = "Running as root";
}

}
}
