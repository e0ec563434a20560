export module Geometry;

// Re-export all partitions so users only need 'import Geometry;'
export import :Handle;
export import :HalfedgeMesh;
export import :Traversal;
export import :Validation;
export import :MeshBuilder;
export import :Primitives;
