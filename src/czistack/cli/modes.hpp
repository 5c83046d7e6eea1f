#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, 1 on a conversion error, 2 on a usage error. */

/* Convert one CZI file, or every *.czi of a directory, into colored PNGs.
   Example:
     czistack-cli convert --input=stack.czi --output=out_dir */
int run_convert (int argc, char** argv);

/* Print the decoded shape and the channel table of a CZI file.
   Example:
     czistack-cli info --input=stack.czi */
int run_info    (int argc, char** argv);

/* Write a synthetic multi-channel Z-stack CZI.
   Example:
     czistack-cli simulate --output=synthetic.czi --channels=3 --depth=8 --size=256x256 */
int run_simulate(int argc, char** argv);
