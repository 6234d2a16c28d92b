export module Resource;

export import :Errors;
export import :Codec;
export import :Field;
export import :PropertyObject;
export import :Wire;
export import :Options;
export import :DataArray;
export import :Mesh;
export import :Mesh1D;
export import :Mesh0D;
export import :Binding;
export import :Composite;
export import :Line;
export import :Point;
export import :Interchange;
export import :ImportRegistry;
export import :Importers.TGF;
export import :Importers.XYZ;
