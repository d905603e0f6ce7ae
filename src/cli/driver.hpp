//! # just-ext Driver Interface
//!
//! `just_ext_main()` dispatches to the command handler named by the first
//! positional argument.

#pragma once

int just_ext_main(int argc, char* argv[]);
