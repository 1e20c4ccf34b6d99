export module Geometry;

// Re-export all partitions so the user only needs 'import Geometry;'
export import :Properties;
export import :HalfedgeMesh;
export import :Validation;
export import :VectorAlgebra;
