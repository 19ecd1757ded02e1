#include "common.h"


//==============================================================================
// struct terminal_input_provider
//==============================================================================

std::string lacq::terminal_input_provider::read_line()
{
    std::string line;
    if (!std::getline(_in, line)) {
        throw configuration_error("End of input while waiting for an answer");
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool lacq::terminal_input_provider::confirm(const std::string& question)
{
    while (true) {
        _out << "# " << question << " [yn] " << std::flush;
        const std::string answer = read_line();
        if (answer == "y" || answer == "Y") {
            return true;
        }
        if (answer == "n" || answer == "N") {
            return false;
        }
        _out << "# Please answer yes or no." << std::endl;
    }
}

std::string lacq::terminal_input_provider::ask(const std::string& prompt)
{
    while (true) {
        _out << "# " << prompt << ": " << std::flush;
        std::string answer = read_line();
        if (!answer.empty()) {
            return answer;
        }
    }
}

std::string lacq::terminal_input_provider::ask_secret(const std::string& prompt)
{
    _out << "# " << prompt << ": " << std::flush;

    // Turn off echo when reading from a terminal
    struct termios saved { };
    const bool is_tty = (&_in == &std::cin) && isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (is_tty) {
        struct termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
            LOG_WARN("Can't turn off terminal echo: errno = {} ({})", errno, strerror(errno));
        }
    }
    const infra::sweeper restore_echo = [&]() {
        if (is_tty) {
            (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
            _out << std::endl;
        }
    };

    // An empty password is a valid answer
    return read_line();
}



//==============================================================================
// struct batch_input_provider
//==============================================================================

bool lacq::batch_input_provider::confirm(const std::string& question)
{
    throw configuration_error("Batch mode: can't ask \"" + question + "\"");
}

std::string lacq::batch_input_provider::ask(const std::string& prompt)
{
    throw configuration_error("Batch mode: missing value for \"" + prompt + "\"");
}

std::string lacq::batch_input_provider::ask_secret(const std::string& prompt)
{
    throw configuration_error("Batch mode: missing value for \"" + prompt + "\"");
}
