#pragma once

/*
 * Shared main() of the unit-test executables:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 *
 * Besides the usual gtest flags, the executables accept the util::Logging options (--log-level
 * etc.), so that LOG_*() output from the code under test can be turned up when debugging a test.
 */
int launch_gtest(int argc, char** argv);
