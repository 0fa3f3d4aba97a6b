#pragma once
///@file

/* Colours used in diagnostics. Empty unless built with PIPETOML_COLOR. */

#ifdef PIPETOML_COLOR
#  define ANSI_NORMAL "\e[0m"
#  define ANSI_RED "\e[31;1m"
#  define ANSI_GREEN "\e[32;1m"
#  define ANSI_BLUE "\e[34;1m"
#  define ANSI_MAGENTA "\e[35;1m"
#else
#  define ANSI_NORMAL ""
#  define ANSI_RED ""
#  define ANSI_GREEN ""
#  define ANSI_BLUE ""
#  define ANSI_MAGENTA ""
#endif
