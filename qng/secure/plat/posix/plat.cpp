#include <qng/secure/plat.hpp>

#include <pwd.h>
#include <sys/types.h>
#include <termios.h>
#include <unistd.h>

boost::filesystem::path qng::AppPath()
{
    auto entry(getpwuid(getuid()));
    boost::filesystem::path result(entry->pw_dir);
    return result;
}

void qng::SetStdinEcho(bool enable)
{
    struct termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        return;
    }
    if (enable)
    {
        tty.c_lflag |= ECHO;
    }
    else
    {
        tty.c_lflag &= ~ECHO;
    }
    (void)tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}
