#pragma once

/**
 * @brief Prints the usage summary to stdout.
 */
void PrintHelp();

/**
 * @brief Prints the program version to stdout.
 */
void PrintVersion();
