#pragma once

namespace attest::cli
{

    /**
     * Entry point of the attest command line.
     * @return 0 on success, 1 on usage or I/O errors, 2 on failed verification or denial
     */
    int run(int argc, char *argv[]);

} // namespace attest::cli
