#pragma once

namespace nodes {

class NodeRegistry;

/**
 * Register CSV-related nodes:
 * - load_csv: reads a CSV file into a frame
 * - count_rows: number of rows of a frame
 */
void registerCsvNodes(NodeRegistry& registry);

/**
 * Register load_csv node
 *
 * Inputs:
 *   - path (Text): file to read; header row, comma separated
 *
 * Outputs:
 *   - out (Frame): the loaded table, column types inferred
 *
 * Fails with FileReadFailure when the file cannot be opened and
 * ParseFailure when its content is malformed.
 */
void registerLoadCsvNode(NodeRegistry& registry);

/**
 * Register count_rows node
 *
 * Inputs:
 *   - df (Frame)
 *
 * Outputs:
 *   - out (Scalar): row count as a double
 */
void registerCountRowsNode(NodeRegistry& registry);

} // namespace nodes
