#pragma once

namespace nodes {

class NodeRegistry;

/**
 * Register all select nodes
 */
void registerSelectNodes(NodeRegistry& registry);

/**
 * select_column
 *
 * Extracts one column of a frame as a series.
 *
 * Inputs:
 *   - df: Input frame
 *   - column: Column name (Text)
 *
 * Outputs:
 *   - out: Copy of the column, or an empty series named "empty"
 *          when the frame has no such column
 */
void registerSelectColumnNode(NodeRegistry& registry);

/**
 * simple_filter
 *
 * Keeps the entries of a numeric series with min <= value <= max.
 * Null entries are dropped. A text series is a type mismatch.
 *
 * Inputs:
 *   - df: Input series
 *   - min, max: Inclusive bounds (Scalar)
 *
 * Outputs:
 *   - out: Filtered series, same name and column type
 */
void registerSimpleFilterNode(NodeRegistry& registry);

} // namespace nodes
