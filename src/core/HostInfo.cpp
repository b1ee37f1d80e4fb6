#include "HostInfo.h"
#include "Logging.h"
#include <sys/utsname.h>
#include <cstdlib>

namespace conn_tracker {

std::string resolve_hostname(const std::string& override_name){
    const char* env = getenv("CONN_TRACKER_HOSTNAME");
    if(env && *env) return env;
    if(!override_name.empty()) return override_name;
    struct utsname u{};
    if(uname(&u) != 0){
        Logger::instance().warn("uname failed; host identifier left empty");
        return "";
    }
    return u.nodename;
}

}
