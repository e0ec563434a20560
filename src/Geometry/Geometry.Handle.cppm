module;

export module Geometry:Handle;
import Core;

export namespace Geometry
{
    struct VertexTag {};
    struct HalfedgeTag {};
    struct FaceTag {};

    using VertexHandle = Core::StrongHandle<VertexTag>;
    using HalfedgeHandle = Core::StrongHandle<HalfedgeTag>;
    using FaceHandle = Core::StrongHandle<FaceTag>;
}
