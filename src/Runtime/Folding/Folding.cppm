export module Folding;

// Re-export all partitions so the user only needs 'import Folding;'
export import :Tolerances;
export import :MeshQueries;
export import :StarBuilder;
export import :Inspection;
export import :Bend;
export import :Reattach;
export import :Relaxation;
export import :Script;
export import :Session;
export import :Examples;
