#include "config.hpp"

namespace bubble {

int COMPILE_MEM_LIMIT = 1 << 20;   // 1G
double COMPILE_TIME_LIMIT = 10;    // 10s
int COMPILE_FILE_LIMIT = 1 << 19;  // 512M
double KILL_AFTER = 1;             // 1s
double WATCHDOG_SLACK = 1;         // 1s
bool DEBUG = false;
const char *VERSION = "0.1.0";

}  // namespace bubble
