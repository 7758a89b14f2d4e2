#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/**
 * @brief Print usage information grouped by command.
 *
 * @param prog Program name shown in the usage line.
 */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
